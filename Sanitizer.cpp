#include "Sanitizer.hpp"

std::string Sanitizer::sanitize(std::string_view name, char substitution) {
  std::string result(name);
  for (char& c : result) {
    if (kDisallowedCharacters.find(c) != std::string_view::npos) {
      c = substitution;
    }
  }
  return result;
}
