#pragma once

#include "taskrunner/config/config_source.hpp"
#include "taskrunner/config/run_settings.hpp"
#include "taskrunner/core/error.hpp"
#include "taskrunner/util/id.hpp"

#include <yaml-cpp/yaml.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskrunner {

inline constexpr std::string_view kRunnerSection = "runner";
inline constexpr std::string_view kEnvSection = "env";

// One per-task section of the config file.
struct TaskSection {
  std::vector<TaskId> depends_on;
  TaskOverrides overrides;
};

// Loaded configuration file. Every top-level mapping is a section; `runner`
// holds the global settings, `env` the environment overlay, and any other
// section is named after a task file.
class RunConfig : public IConfigLookup, public ITaskConfigSource {
public:
  RunConfig() = default;
  RunConfig(YAML::Node root, RunSettings settings,
            std::map<std::string, std::string> env,
            std::unordered_map<TaskId, TaskSection> tasks);

  [[nodiscard]] auto settings() const noexcept -> const RunSettings& {
    return settings_;
  }
  [[nodiscard]] auto settings() noexcept -> RunSettings& {
    return settings_;
  }

  [[nodiscard]] auto env_overlay() const noexcept
      -> const std::map<std::string, std::string>& {
    return env_;
  }

  [[nodiscard]] auto get(std::string_view section,
                         std::string_view option) const
      -> std::optional<std::string> override;

  [[nodiscard]] auto depends_on(const TaskId& task) const
      -> std::vector<TaskId> override;
  [[nodiscard]] auto task_overrides(const TaskId& task) const
      -> TaskOverrides override;

private:
  YAML::Node root_;
  RunSettings settings_;
  std::map<std::string, std::string> env_;
  std::unordered_map<TaskId, TaskSection> tasks_;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<RunConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<RunConfig>;
};

}  // namespace taskrunner
