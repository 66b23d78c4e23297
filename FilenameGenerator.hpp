#pragma once

#include <expected>
#include <string>

#include "MetadataProvider.hpp"
#include "types.hpp"

// Resolves a compiled scheme against one file's metadata. Failures are local
// to the file: they are logged and returned, never thrown.
class FilenameGenerator {
 public:
  explicit FilenameGenerator(const MetadataProvider& provider);

  std::expected<std::string, FileFailure> resolve(const fs::path& path,
                                                  const Scheme& scheme,
                                                  char substitution) const;

 private:
  std::expected<std::string, FileFailure> build_name(
      const fs::path& path, const Scheme& scheme, char substitution) const;

  const MetadataProvider& m_provider;
};
