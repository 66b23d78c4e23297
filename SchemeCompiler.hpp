#pragma once

#include <string>

#include "types.hpp"

namespace SchemeCompiler {
// Keeps JSON strings as literals and {"key": "<name>"} objects as metadata
// keys, in order. Everything else is dropped. Never throws.
Scheme compile(const json& raw);

// Renders a scheme for display, e.g. "Test-{date_time}".
std::string describe(const Scheme& scheme);
}  // namespace SchemeCompiler
