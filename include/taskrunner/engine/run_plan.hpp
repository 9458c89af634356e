#pragma once

#include "taskrunner/executor/environment.hpp"
#include "taskrunner/util/id.hpp"

#include <filesystem>
#include <vector>

namespace taskrunner {

// Everything one iteration needs, fixed before the first process starts.
struct RunPlan {
  std::filesystem::path task_dir;
  std::vector<TaskId> order;  // never contains the halt task
  Environment env;
};

}  // namespace taskrunner
