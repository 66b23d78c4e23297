#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "MetadataExtractor.hpp"

// Reads EXIF metadata from still images through Exiv2.
class ImageExtractor : public MetadataExtractor {
 public:
  Metadata extract(const fs::path& path) const override;

  // "DateTimeOriginal" -> "date_time_original", "FNumber" -> "f_number".
  static std::string tag_to_key(std::string_view tag_name);

  // "2003:09:03 12:52:43" + "-04:00" -> "2003-09-03 12:52:43 -0400".
  // Without a usable offset, the local zone's offset at that wall-clock time
  // is appended. Values that are not EXIF date-times are returned unchanged.
  static std::string format_datetime(std::string_view value,
                                     std::string_view offset);

  // -240min -> "-0400".
  static std::string format_utc_offset(std::chrono::minutes offset);
};
