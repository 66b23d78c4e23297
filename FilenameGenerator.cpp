#include "FilenameGenerator.hpp"

#include <format>

#include "IOManager.hpp"
#include "Sanitizer.hpp"
#include "utils.hpp"

FilenameGenerator::FilenameGenerator(const MetadataProvider& provider)
    : m_provider(provider) {}

std::expected<std::string, FileFailure> FilenameGenerator::resolve(
    const fs::path& path, const Scheme& scheme, char substitution) const {
  auto result = build_name(path, scheme, substitution);
  if (!result) {
    IOManager::log(std::format("Ignoring file '{}' [{}]: {}",
                               safe_path_to_string(path),
                               error_kind_name(result.error().kind),
                               result.error().detail));
  }
  return result;
}

std::expected<std::string, FileFailure> FilenameGenerator::build_name(
    const fs::path& path, const Scheme& scheme, char substitution) const {
  Metadata metadata;
  try {
    if (path.empty() || !fs::is_regular_file(path)) {
      return std::unexpected(FileFailure{
          ErrorKind::FileNotValid,
          std::format("Could not access specified file '{}'",
                      safe_path_to_string(path))});
    }
    metadata = m_provider.lookup(fs::absolute(path));
  } catch (const UnsupportedFileTypeError& e) {
    return std::unexpected(
        FileFailure{ErrorKind::UnsupportedFileType, e.what()});
  } catch (const MetadataReadError& e) {
    return std::unexpected(FileFailure{ErrorKind::MetadataRead, e.what()});
  } catch (const fs::filesystem_error& e) {
    return std::unexpected(FileFailure{ErrorKind::FileNotValid, e.what()});
  } catch (const std::exception& e) {
    return std::unexpected(FileFailure{
        ErrorKind::MetadataRead,
        std::format("Unexpected error reading metadata: {}", e.what())});
  }

  std::string name;
  for (const auto& token : scheme) {
    if (const auto* literal = std::get_if<Literal>(&token)) {
      name += literal->text;
      continue;
    }
    const auto& key = std::get<MetadataKey>(token).name;
    auto it = metadata.find(key);
    if (it == metadata.end() || it->second.empty()) {
      return std::unexpected(FileFailure{
          ErrorKind::MissingMetadata,
          std::format("No value for metadata tag '{}' in scheme", key)});
    }
    name += it->second;
  }

  name += safe_path_to_string(path.extension());
  return Sanitizer::sanitize(name, substitution);
}
