#include "MetadataProvider.hpp"

#include <format>

#include "AudioExtractor.hpp"
#include "ImageExtractor.hpp"
#include "utils.hpp"

MetadataProvider MetadataProvider::with_default_extractors() {
  MetadataProvider provider;
  provider.register_extractor({".jpg", ".jpeg", ".tif", ".tiff", ".png",
                               ".webp", ".dng", ".cr2", ".nef", ".arw"},
                              std::make_shared<ImageExtractor>());
  provider.register_extractor(
      {".mp3", ".wav", ".flac", ".aiff", ".ogg", ".m4a", ".asf"},
      std::make_shared<AudioExtractor>());
  return provider;
}

void MetadataProvider::register_extractor(
    std::initializer_list<std::string_view> extensions,
    std::shared_ptr<const MetadataExtractor> extractor) {
  for (const auto ext : extensions) {
    m_routes[string_to_lower_ascii(ext)] = extractor;
  }
}

bool MetadataProvider::supports(const fs::path& path) const {
  return m_routes.contains(
      string_to_lower_ascii(safe_path_to_string(path.extension())));
}

Metadata MetadataProvider::lookup(const fs::path& path) const {
  const std::string ext = safe_path_to_string(path.extension());
  auto it = m_routes.find(string_to_lower_ascii(ext));
  if (it == m_routes.end()) {
    throw UnsupportedFileTypeError(
        std::format("Extension '{}' is not supported ({})", ext,
                    safe_path_to_string(path)));
  }
  return it->second->extract(path);
}
