#include "AudioExtractor.hpp"

#include <format>
#include <taglib/audioproperties.h>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tpropertymap.h>

#include "utils.hpp"

namespace {
void put_text(Metadata& metadata, const char* key, const TagLib::String& value) {
  if (!value.isEmpty()) {
    metadata.try_emplace(key, value.to8Bit(true));
  }
}

void put_number(Metadata& metadata, const char* key, long long value) {
  if (value > 0) {
    metadata.try_emplace(key, std::to_string(value));
  }
}
}  // namespace

Metadata AudioExtractor::extract(const fs::path& path) const {
  TagLib::FileRef file(path.c_str());
  if (file.isNull()) {
    throw MetadataReadError(
        std::format("TagLib could not open '{}'", safe_path_to_string(path)));
  }

  Metadata metadata;
  if (const TagLib::Tag* tag = file.tag()) {
    put_text(metadata, "title", tag->title());
    put_text(metadata, "artist", tag->artist());
    put_text(metadata, "album", tag->album());
    put_text(metadata, "comment", tag->comment());
    put_text(metadata, "genre", tag->genre());
    put_number(metadata, "year", tag->year());
    put_number(metadata, "track", tag->track());

    const TagLib::PropertyMap properties = tag->properties();
    for (const auto& [name, values] : properties) {
      if (values.isEmpty() || values.front().isEmpty()) continue;
      metadata.try_emplace(string_to_lower_ascii(name.to8Bit(true)),
                           values.front().to8Bit(true));
    }
  }

  if (const TagLib::AudioProperties* props = file.audioProperties()) {
    put_number(metadata, "length", props->lengthInSeconds());
    put_number(metadata, "bitrate", props->bitrate());
    put_number(metadata, "sample_rate", props->sampleRate());
    put_number(metadata, "channels", props->channels());
  }

  return metadata;
}
