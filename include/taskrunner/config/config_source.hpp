#pragma once

#include "taskrunner/config/run_settings.hpp"
#include "taskrunner/util/id.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskrunner {

// `section.option` lookup used by `--get`.
class IConfigLookup {
public:
  virtual ~IConfigLookup() = default;

  [[nodiscard]] virtual auto get(std::string_view section,
                                 std::string_view option) const
      -> std::optional<std::string> = 0;
};

// Per-task metadata consumed by the resolver and the engine.
class ITaskConfigSource {
public:
  virtual ~ITaskConfigSource() = default;

  [[nodiscard]] virtual auto depends_on(const TaskId& task) const
      -> std::vector<TaskId> = 0;
  [[nodiscard]] virtual auto task_overrides(const TaskId& task) const
      -> TaskOverrides = 0;
};

}  // namespace taskrunner
