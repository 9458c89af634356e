#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace taskrunner {

// Global defaults from the `runner` section.
struct RunSettings {
  std::chrono::seconds max_time{600};  // 0 = unlimited
  int max_tries{5};
  std::chrono::seconds sleep_time{60};
  std::string interpreter;
  std::string halt_task{"halt.sh"};
  std::string pre_task_hook;
  std::string post_task_hook;
  std::string log_level{"info"};
};

// The subset of RunSettings a task section may override.
struct TaskOverrides {
  std::optional<std::chrono::seconds> max_time;
  std::optional<int> max_tries;
  std::optional<std::chrono::seconds> sleep_time;
  std::optional<std::string> interpreter;

  [[nodiscard]] auto empty() const noexcept -> bool {
    return !max_time && !max_tries && !sleep_time && !interpreter;
  }
};

struct EffectiveTaskConfig {
  std::chrono::seconds max_time{0};
  int max_tries{0};
  std::chrono::seconds sleep_time{0};
  std::string interpreter;
};

[[nodiscard]] inline auto resolve_task_config(const RunSettings& defaults,
                                              const TaskOverrides& overrides)
    -> EffectiveTaskConfig {
  return EffectiveTaskConfig{
      .max_time = overrides.max_time.value_or(defaults.max_time),
      .max_tries = overrides.max_tries.value_or(defaults.max_tries),
      .sleep_time = overrides.sleep_time.value_or(defaults.sleep_time),
      .interpreter = overrides.interpreter.value_or(defaults.interpreter),
  };
}

}  // namespace taskrunner
