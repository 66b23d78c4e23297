#pragma once

#include "types.hpp"

class MetadataExtractor {
 public:
  virtual ~MetadataExtractor() = default;

  // Throws MetadataReadError when the file cannot be read.
  virtual Metadata extract(const fs::path& path) const = 0;
};
