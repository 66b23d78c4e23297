#include "RenameExecutor.hpp"

#include <format>
#include <system_error>

#include "IOManager.hpp"
#include "utils.hpp"

std::optional<FileFailure> RenameExecutor::validate(const RenameEntry& entry) {
  std::error_code ec;
  if (entry.from.empty() || !fs::is_regular_file(entry.from, ec)) {
    return FileFailure{ErrorKind::FileNotValid,
                       std::format("Could not access specified source file '{}'",
                                   safe_path_to_string(entry.from))};
  }
  if (entry.to.empty()) {
    return FileFailure{ErrorKind::FileNotValid, "New file name is empty"};
  }
  // The new name is joined to the source directory, so it must stay a bare
  // file name.
  const fs::path target = path_from_utf8(entry.to);
  if (entry.to.find('/') != std::string::npos ||
      target.filename() != target || entry.to == "." || entry.to == "..") {
    return FileFailure{
        ErrorKind::FileNotValid,
        std::format("New file name '{}' is not a bare file name", entry.to)};
  }

  // Never replace another file. Renaming a file onto itself (a case-only
  // change on a case-insensitive volume) is allowed.
  const fs::path from_path = fs::absolute(entry.from, ec);
  const fs::path to_path = from_path.parent_path() / target;
  if (!ec && fs::exists(to_path, ec) &&
      !fs::equivalent(from_path, to_path, ec)) {
    return FileFailure{ErrorKind::FileNotValid,
                       std::format("Destination '{}' already exists",
                                   safe_path_to_string(to_path))};
  }
  return std::nullopt;
}

void RenameExecutor::execute(const RenamePlan& plan) {
  IOManager::log(std::format("Executing {} renames...", plan.size()));

  for (const auto& entry : plan) {
    if (auto failure = validate(entry)) {
      IOManager::log(std::format("Ignoring rename for '{}' => '{}' [{}]: {}",
                                 safe_path_to_string(entry.from), entry.to,
                                 error_kind_name(failure->kind),
                                 failure->detail));
      continue;
    }

    try {
      const fs::path from_path = fs::absolute(entry.from);
      const fs::path to_path = from_path.parent_path() / path_from_utf8(entry.to);

      IOManager::log(std::format("Renaming '{}' -> '{}'",
                                 safe_path_to_string(from_path),
                                 safe_path_to_string(to_path)));
      fs::rename(from_path, to_path);
    } catch (const fs::filesystem_error& e) {
      IOManager::log(std::format("Ignoring rename for '{}' => '{}': {}",
                                 safe_path_to_string(entry.from), entry.to,
                                 e.what()));
    }
  }

  IOManager::log("Execution complete.");
}
