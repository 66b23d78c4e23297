#include "IOManager.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>

#include "utils.hpp"

namespace {
std::ofstream& get_log_stream() {
  static std::ofstream log_file("media_renamer.log", std::ios_base::app);
  return log_file;
}

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

std::optional<json> read_json_file(const fs::path& path,
                                   std::string_view what) {
  if (!fs::exists(path)) {
    IOManager::log(std::format("Error: {} not found at {}", what,
                               safe_path_to_string(path)));
    return std::nullopt;
  }
  std::ifstream file(path);
  try {
    return json::parse(file);
  } catch (const json::exception& e) {
    IOManager::log(std::format("Error parsing {} '{}': {}", what,
                               safe_path_to_string(path), e.what()));
    return std::nullopt;
  }
}

}  // namespace

void IOManager::initialize_logger() { get_log_stream(); }

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  std::string full_message = std::format("{:%Y-%m-%d %H:%M:%S} | {}", now,
                                         message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  auto& log_stream = get_log_stream();
  if (log_stream.is_open()) {
    log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  auto configJson = read_json_file(configPath, "config file");
  if (!configJson) {
    return std::nullopt;
  }
  try {
    return configJson->get<Config>();
  } catch (const json::exception& e) {
    log(std::format("Error reading config '{}': {}",
                    safe_path_to_string(configPath), e.what()));
  } catch (const InvalidArgumentError& e) {
    log(std::format("Error reading config '{}': {}",
                    safe_path_to_string(configPath), e.what()));
  }
  return std::nullopt;
}

std::optional<json> IOManager::load_path_list(const fs::path& listPath) {
  return read_json_file(listPath, "path list");
}

json IOManager::build_path_list(json pathList,
                                const std::vector<fs::path>& files) {
  if (!pathList.is_array()) {
    throw InvalidArgumentError(std::format(
        "Path list must be a JSON array of paths, got {}",
        pathList.type_name()));
  }
  for (const auto& file : files) {
    pathList.push_back(safe_path_to_string(file));
  }
  return pathList;
}
