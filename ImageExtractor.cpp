#include "ImageExtractor.hpp"

#include <array>
#include <chrono>
#include <exiv2/exiv2.hpp>
#include <format>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;

bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_lower_or_digit(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}
bool is_digit(char c) { return c >= '0' && c <= '9'; }

int to_number(std::string_view digits) {
  int n = 0;
  for (char c : digits) n = n * 10 + (c - '0');
  return n;
}

// Local zone offset at a "YYYY:MM:DD HH:MM:SS" wall-clock time. Empty when
// the date is invalid or no time zone database is available.
std::optional<std::string> local_offset(std::string_view value) {
  using namespace std::chrono;
  const year_month_day date{year{to_number(value.substr(0, 4))},
                            month{unsigned(to_number(value.substr(5, 2)))},
                            day{unsigned(to_number(value.substr(8, 2)))}};
  if (!date.ok()) {
    return std::nullopt;
  }
  const local_seconds wall = local_days{date} +
                             hours{to_number(value.substr(11, 2))} +
                             minutes{to_number(value.substr(14, 2))} +
                             seconds{to_number(value.substr(17, 2))};
  try {
    const local_info info = current_zone()->get_info(wall);
    return ImageExtractor::format_utc_offset(
        duration_cast<minutes>(info.first.offset));
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }
}

// Date-time keys and the EXIF offset key that qualifies each of them.
constexpr std::array<std::pair<std::string_view, std::string_view>, 3>
    kDateTimeKeys = {{{"date_time", "offset_time"},
                      {"date_time_original", "offset_time_original"},
                      {"date_time_digitized", "offset_time_digitized"}}};
}  // namespace

std::string ImageExtractor::tag_to_key(std::string_view tag_name) {
  std::string key;
  key.reserve(tag_name.size() + 4);
  for (size_t i = 0; i < tag_name.size(); ++i) {
    const char c = tag_name[i];
    if (is_upper(c) && i > 0) {
      const char prev = tag_name[i - 1];
      const bool next_is_lower =
          i + 1 < tag_name.size() && tag_name[i + 1] >= 'a' &&
          tag_name[i + 1] <= 'z';
      if (is_lower_or_digit(prev) || (is_upper(prev) && next_is_lower)) {
        key += '_';
      }
    }
    key += is_upper(c) ? static_cast<char>(c + ('a' - 'A')) : c;
  }
  return key;
}

std::string ImageExtractor::format_datetime(std::string_view value,
                                            std::string_view offset) {
  // YYYY:MM:DD HH:MM:SS
  if (value.size() < 19 || value[4] != ':' || value[7] != ':' ||
      value[10] != ' ' || value[13] != ':' || value[16] != ':') {
    return std::string(value);
  }
  for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9, 11, 12, 14, 15, 17, 18}) {
    if (!is_digit(value[i])) return std::string(value);
  }

  std::string result(value.substr(0, 19));
  result[4] = '-';
  result[7] = '-';

  // +hh:mm
  if (offset.size() == 6 && (offset[0] == '+' || offset[0] == '-') &&
      offset[3] == ':') {
    result += std::format(" {}{}{}", offset.substr(0, 1), offset.substr(1, 2),
                          offset.substr(4, 2));
  } else if (auto local = local_offset(value)) {
    result += " " + *local;
  }
  return result;
}

std::string ImageExtractor::format_utc_offset(std::chrono::minutes offset) {
  const auto total = offset.count();
  const auto magnitude = total < 0 ? -total : total;
  return std::format("{}{:02}{:02}", total < 0 ? '-' : '+', magnitude / 60,
                     magnitude % 60);
}

Metadata ImageExtractor::extract(const fs::path& path) const {
  std::scoped_lock lock(g_exiv2_mutex);

  Metadata metadata;
  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) {
      throw MetadataReadError(
          std::format("Exiv2 could not open '{}'", safe_path_to_string(path)));
    }
    image->readMetadata();

    for (const auto& datum : image->exifData()) {
      std::string key = tag_to_key(datum.tagName());
      if (!metadata.contains(key)) {
        metadata.emplace(std::move(key), datum.toString());
      }
    }

    if (image->pixelWidth() > 0) {
      metadata.try_emplace("width", std::to_string(image->pixelWidth()));
    }
    if (image->pixelHeight() > 0) {
      metadata.try_emplace("height", std::to_string(image->pixelHeight()));
    }
  } catch (const Exiv2::Error& e) {
    throw MetadataReadError(std::format("Exiv2 error reading '{}': {}",
                                        safe_path_to_string(path), e.what()));
  }

  for (const auto& [date_key, offset_key] : kDateTimeKeys) {
    auto it = metadata.find(std::string(date_key));
    if (it == metadata.end()) continue;
    auto offset_it = metadata.find(std::string(offset_key));
    it->second = format_datetime(
        it->second,
        offset_it != metadata.end() ? offset_it->second : std::string_view{});
  }

  return metadata;
}
