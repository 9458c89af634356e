#pragma once

#include "taskrunner/core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace taskrunner {

// Names of the task files in `dir`: regular files (symlinks followed),
// hidden files skipped, sorted by name.
[[nodiscard]] auto list_task_directory(std::string_view dir)
    -> Result<std::vector<std::string>>;

}  // namespace taskrunner
