#include <exception>
#include <exiv2/exiv2.hpp>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <string_view>
#include <vector>

#include "IOManager.hpp"
#include "Renamer.hpp"
#include "UI.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {
enum class RunMode { Interactive, PrintPlan, Apply };

struct Options {
  RunMode mode = RunMode::Interactive;
  std::optional<fs::path> configPath;
  std::optional<fs::path> listPath;
  std::vector<fs::path> files;
};

void print_usage() {
  std::println(stderr,
               "Usage: media_renamer [--config FILE] [--list FILE.json] "
               "[--plan | --apply] [FILE...]");
  std::println(stderr, "  --config FILE  naming scheme configuration");
  std::println(stderr, "  --list FILE    JSON array of files to rename");
  std::println(stderr, "  --plan         print the rename plan as JSON");
  std::println(stderr, "  --apply        rename without confirmation");
}

std::optional<Options> parse_arguments(int argc, char* argv[]) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if ((arg == "--config" || arg == "--list") && i + 1 < argc) {
      (arg == "--config" ? options.configPath : options.listPath) =
          path_from_utf8(argv[++i]);
    } else if (arg == "--plan") {
      options.mode = RunMode::PrintPlan;
    } else if (arg == "--apply") {
      options.mode = RunMode::Apply;
    } else if (arg == "--help" || arg == "-h" || arg.starts_with("--")) {
      return std::nullopt;
    } else {
      options.files.push_back(path_from_utf8(arg));
    }
  }
  return options;
}

// Routes Exiv2 warnings into our log instead of stderr.
void exiv2_log_handler(int, const char* message) {
  std::string_view text = message;
  while (!text.empty() && text.back() == '\n') text.remove_suffix(1);
  IOManager::log(std::format("Exiv2: {}", text));
}

std::optional<Config> find_config(const Options& options, const char* argv0) {
  if (options.configPath) {
    return IOManager::load_config(*options.configPath);
  }

  fs::path exePath = fs::path(argv0).parent_path();
  if (exePath.empty()) {
    exePath = fs::current_path();
  }

  std::vector<fs::path> configPaths = {exePath / "config.json",
                                       fs::current_path() / "config.json",
                                       exePath.parent_path() / "config.json"};
  for (const auto& configPath : configPaths) {
    if (fs::exists(configPath)) {
      IOManager::log(std::format("Found config.json at: {}",
                                 safe_path_to_string(configPath)));
      return IOManager::load_config(configPath);
    }
  }

  IOManager::log("No config.json found, using the default naming scheme.");
  return Config{};
}

int run(const Options& options, const char* argv0) {
  auto configOpt = find_config(options, argv0);
  if (!configOpt) {
    std::println(stderr, "Failed to load configuration. Check "
                         "media_renamer.log for details.");
    return 1;
  }

  Renamer renamer(*configOpt);

  json listJson = json::array();
  if (options.listPath) {
    auto loaded = IOManager::load_path_list(*options.listPath);
    if (!loaded) {
      std::println(stderr, "Failed to read path list {}",
                   safe_path_to_string(*options.listPath));
      return 1;
    }
    listJson = std::move(*loaded);
  }
  json pathList =
      IOManager::build_path_list(std::move(listJson), options.files);
  if (pathList.empty()) {
    print_usage();
    return 1;
  }

  switch (options.mode) {
    case RunMode::PrintPlan: {
      RenamePlan plan = renamer.generate_from_json(pathList);
      std::println("{}", json(plan).dump(2));
      return 0;
    }
    case RunMode::Apply: {
      RenamePlan plan = renamer.generate_from_json(pathList);
      renamer.overwrite(plan);
      std::println("Attempted {} of {} renames. See media_renamer.log.",
                   plan.size(), pathList.size());
      return 0;
    }
    case RunMode::Interactive: {
      auto application = std::make_shared<UI>(renamer, std::move(pathList));
      application->run();
      return 0;
    }
  }
  return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
  Exiv2::XmpParser::initialize();
  Exiv2::LogMsg::setHandler(exiv2_log_handler);

  int status = 1;
  try {
    IOManager::initialize_logger();
    IOManager::log("--- Media Renamer Started ---");

    auto options = parse_arguments(argc, argv);
    if (!options) {
      print_usage();
    } else {
      status = run(*options, argc > 0 ? argv[0] : "");
    }
    IOManager::log("--- Media Renamer Exited ---");
  } catch (const InvalidArgumentError& e) {
    IOManager::log(std::format("Invalid arguments: {}", e.what()));
    std::println(stderr, "Invalid arguments: {}", e.what());
  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check media_renamer.log for details.");
  }

  Exiv2::XmpParser::terminate();
  return status;
}
