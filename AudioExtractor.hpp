#pragma once

#include "MetadataExtractor.hpp"

// Reads audio tags and stream properties through TagLib.
class AudioExtractor : public MetadataExtractor {
 public:
  Metadata extract(const fs::path& path) const override;
};
