#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>

#include "MetadataExtractor.hpp"

// Routes a file to the extractor registered for its lower-cased extension.
class MetadataProvider {
 public:
  MetadataProvider() = default;

  // Image extensions go to Exiv2, the fixed audio set goes to TagLib.
  static MetadataProvider with_default_extractors();

  // Adds or replaces the route for each extension (".ext", any case).
  void register_extractor(std::initializer_list<std::string_view> extensions,
                          std::shared_ptr<const MetadataExtractor> extractor);

  bool supports(const fs::path& path) const;

  // Throws UnsupportedFileTypeError when no extractor handles the extension.
  Metadata lookup(const fs::path& path) const;

 private:
  std::unordered_map<std::string, std::shared_ptr<const MetadataExtractor>>
      m_routes;
};
