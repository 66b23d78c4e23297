#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

struct Literal {
  std::string text;
};

struct MetadataKey {
  std::string name;
};

using Token = std::variant<Literal, MetadataKey>;
using Scheme = std::vector<Token>;

using Metadata = std::unordered_map<std::string, std::string>;

struct RenameEntry {
  fs::path from;
  std::string to;  // bare filename, never carries a directory
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RenameEntry, from, to);

using RenamePlan = std::vector<RenameEntry>;

enum class ErrorKind {
  InvalidArgument,
  FileNotValid,
  UnsupportedFileType,
  MissingMetadata,
  MetadataRead,
  RenameFailed,  // reserved, nothing raises it
};
NLOHMANN_JSON_SERIALIZE_ENUM(
    ErrorKind, {{ErrorKind::InvalidArgument, "InvalidArgument"},
                {ErrorKind::FileNotValid, "FileNotValid"},
                {ErrorKind::UnsupportedFileType, "UnsupportedFileType"},
                {ErrorKind::MissingMetadata, "MissingMetadata"},
                {ErrorKind::MetadataRead, "MetadataRead"},
                {ErrorKind::RenameFailed, "RenameFailed"}});

struct FileFailure {
  ErrorKind kind;
  std::string detail;
};

class RenamerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidArgumentError : public RenamerError {
 public:
  using RenamerError::RenamerError;
};

class FileNotValidError : public RenamerError {
 public:
  using RenamerError::RenamerError;
};

class UnsupportedFileTypeError : public RenamerError {
 public:
  using RenamerError::RenamerError;
};

class MetadataReadError : public RenamerError {
 public:
  using RenamerError::RenamerError;
};

class RenameFailedError : public RenamerError {
 public:
  using RenamerError::RenamerError;
};

struct Config {
  json naming_scheme = json::array({"Renamed-default-"});
  char substitution_char = '_';
};

inline void from_json(const json& j, Config& c) {
  if (!j.is_object()) {
    throw InvalidArgumentError("configuration must be a JSON object");
  }
  if (j.contains("naming_scheme")) {
    c.naming_scheme = j.at("naming_scheme");
  }
  if (j.contains("substitution_char")) {
    const auto subchar = j.at("substitution_char").get<std::string>();
    if (subchar.size() != 1) {
      throw InvalidArgumentError(
          "substitution_char must be exactly one character");
    }
    c.substitution_char = subchar[0];
  }
}
