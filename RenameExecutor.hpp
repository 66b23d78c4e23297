#pragma once

#include <optional>

#include "types.hpp"

namespace RenameExecutor {
// Renames every entry independently, next to its original file. Invalid,
// colliding or failing entries are logged and skipped. The destination is not checked
// after a rename.
void execute(const RenamePlan& plan);

// Reports why an entry cannot be executed, if it cannot.
std::optional<FileFailure> validate(const RenameEntry& entry);
}  // namespace RenameExecutor
