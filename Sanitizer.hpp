#pragma once

#include <string>
#include <string_view>

namespace Sanitizer {
// Characters that many file systems refuse in a file name.
inline constexpr std::string_view kDisallowedCharacters = "\\:?*<>|\"/";

std::string sanitize(std::string_view name, char substitution);
}  // namespace Sanitizer
