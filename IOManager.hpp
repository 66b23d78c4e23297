#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace IOManager {
void initialize_logger();

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);
std::optional<Config> load_config(const fs::path& configPath);

// Reads a JSON document holding the list of files to rename.
std::optional<json> load_path_list(const fs::path& listPath);

// Appends files to a loaded path list. Throws InvalidArgumentError when the
// list is not a JSON array.
json build_path_list(json pathList, const std::vector<fs::path>& files);
}  // namespace IOManager
