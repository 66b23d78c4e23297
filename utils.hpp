#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "types.hpp"

namespace fs = std::filesystem;

// Converts a std::filesystem::path to a UTF-8 encoded std::string, suitable
// for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Builds a path from a UTF-8 encoded string.
inline fs::path path_from_utf8(std::string_view s) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(s.data()),
                                s.size()));
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is sufficient for file
// extensions and metadata keys.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string error_kind_name(ErrorKind kind) {
  return json(kind).get<std::string>();
}
