#pragma once

#include "taskrunner/core/error.hpp"
#include "taskrunner/util/id.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace taskrunner {

struct TaskSpec {
  TaskId task_id;
  std::vector<TaskId> dependencies;
};

class TaskGraph {
public:
  // Produces the single run order for `tasks`: every task after all of its
  // dependencies, independent tasks in the order given. Fails with
  // UnknownDependency or CycleDetected before anything runs.
  [[nodiscard]] static auto resolve(std::span<const TaskSpec> tasks)
      -> Result<std::vector<TaskId>>;
};

// "a.sh, b.sh" -> [a.sh, b.sh]; blanks around names and empty items dropped.
[[nodiscard]] auto parse_depends_on(std::string_view value)
    -> std::vector<TaskId>;

}  // namespace taskrunner
