#include "taskrunner/config/config.hpp"

#include "taskrunner/config/yaml_utils.hpp"
#include "taskrunner/dag/task_graph.hpp"
#include "taskrunner/util/log.hpp"
#include "taskrunner/util/shell_words.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskrunner::RunSettings> {
  static bool decode(const Node& node, taskrunner::RunSettings& s) {
    if (!node.IsMap()) {
      return false;
    }
    taskrunner::RunSettings defaults;
    s.max_time = taskrunner::yaml_get_seconds_or(node, "max_time", defaults.max_time);
    s.max_tries = taskrunner::yaml_get_or(node, "max_tries", defaults.max_tries);
    s.sleep_time = taskrunner::yaml_get_seconds_or(node, "sleep_time", defaults.sleep_time);
    s.interpreter = taskrunner::yaml_get_or<std::string>(node, "interpreter", "");
    s.halt_task = taskrunner::yaml_get_or<std::string>(node, "halt_task", defaults.halt_task);
    s.pre_task_hook = taskrunner::yaml_get_or<std::string>(node, "pre_task_hook", "");
    s.post_task_hook = taskrunner::yaml_get_or<std::string>(node, "post_task_hook", "");
    s.log_level = taskrunner::yaml_get_or<std::string>(node, "log_level", defaults.log_level);
    return true;
  }
};

template <>
struct convert<taskrunner::TaskOverrides> {
  static bool decode(const Node& node, taskrunner::TaskOverrides& o) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto v = taskrunner::yaml_get_optional<long long>(node, "max_time")) {
      o.max_time = std::chrono::seconds(*v);
    }
    o.max_tries = taskrunner::yaml_get_optional<int>(node, "max_tries");
    if (auto v = taskrunner::yaml_get_optional<long long>(node, "sleep_time")) {
      o.sleep_time = std::chrono::seconds(*v);
    }
    if (auto v = node["interpreter"]) {
      // An explicit null or "" runs the task directly even when a global
      // interpreter is set.
      o.interpreter = v.IsNull() ? std::string{} : v.as<std::string>();
    }
    return true;
  }
};

template <>
struct convert<taskrunner::TaskSection> {
  static bool decode(const Node& node, taskrunner::TaskSection& t) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto deps = node["depends_on"]) {
      if (deps.IsScalar()) {
        t.depends_on = taskrunner::parse_depends_on(deps.Scalar());
      } else if (deps.IsSequence()) {
        for (const auto& item : deps) {
          for (auto& dep : taskrunner::parse_depends_on(item.as<std::string>())) {
            t.depends_on.push_back(std::move(dep));
          }
        }
      } else if (!deps.IsNull()) {
        return false;
      }
    }
    t.overrides = node.as<taskrunner::TaskOverrides>();
    return true;
  }
};

}  // namespace YAML

namespace taskrunner {

namespace {

auto validate_template(std::string_view key, const std::string& value)
    -> Result<void> {
  if (auto words = split_shell_words(value); !words) {
    log::error("{}: cannot split '{}' into words", key, value);
    return fail(words.error());
  }
  return ok();
}

auto validate(const RunSettings& s) -> Result<void> {
  if (s.max_tries < 1) {
    log::error("runner.max_tries must be at least 1, got {}", s.max_tries);
    return fail(Error::InvalidArgument);
  }
  if (s.max_time.count() < 0 || s.sleep_time.count() < 0) {
    log::error("runner.max_time and runner.sleep_time must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (s.halt_task.empty()) {
    log::error("runner.halt_task must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (auto r = validate_template("runner.interpreter", s.interpreter); !r) {
    return r;
  }
  if (auto r = validate_template("runner.pre_task_hook", s.pre_task_hook); !r) {
    return r;
  }
  return validate_template("runner.post_task_hook", s.post_task_hook);
}

auto validate(const TaskId& task, const TaskOverrides& o) -> Result<void> {
  if (o.max_tries && *o.max_tries < 1) {
    log::error("{}.max_tries must be at least 1, got {}", task, *o.max_tries);
    return fail(Error::InvalidArgument);
  }
  if ((o.max_time && o.max_time->count() < 0) ||
      (o.sleep_time && o.sleep_time->count() < 0)) {
    log::error("{}: max_time and sleep_time must not be negative", task);
    return fail(Error::InvalidArgument);
  }
  if (o.interpreter) {
    return validate_template(task.value(), *o.interpreter);
  }
  return ok();
}

auto parse_env(const YAML::Node& node)
    -> Result<std::map<std::string, std::string>> {
  std::map<std::string, std::string> env;
  if (!node || node.IsNull()) {
    return ok(std::move(env));
  }
  if (!node.IsMap()) {
    log::error("'{}' section must be a mapping", kEnvSection);
    return fail(Error::ParseError);
  }
  for (const auto& kv : node) {
    if (!kv.second.IsScalar()) {
      log::error("{}.{} must be a scalar", kEnvSection, kv.first.Scalar());
      return fail(Error::ParseError);
    }
    env[kv.first.as<std::string>()] = kv.second.as<std::string>();
  }
  return ok(std::move(env));
}

}  // namespace

RunConfig::RunConfig(YAML::Node root, RunSettings settings,
                     std::map<std::string, std::string> env,
                     std::unordered_map<TaskId, TaskSection> tasks)
    : root_{std::move(root)},
      settings_{std::move(settings)},
      env_{std::move(env)},
      tasks_{std::move(tasks)} {
}

auto RunConfig::get(std::string_view section, std::string_view option) const
    -> std::optional<std::string> {
  if (!root_.IsMap()) {
    return std::nullopt;
  }
  auto sec = root_[std::string(section)];
  if (!sec || !sec.IsMap()) {
    return std::nullopt;
  }
  auto value = sec[std::string(option)];
  if (!value) {
    return std::nullopt;
  }
  if (value.IsScalar()) {
    return value.Scalar();
  }
  if (value.IsSequence()) {
    std::string joined;
    for (const auto& item : value) {
      if (!item.IsScalar()) {
        return std::nullopt;
      }
      if (!joined.empty()) {
        joined += ", ";
      }
      joined += item.Scalar();
    }
    return joined;
  }
  return std::nullopt;
}

auto RunConfig::depends_on(const TaskId& task) const -> std::vector<TaskId> {
  auto it = tasks_.find(task);
  return it != tasks_.end() ? it->second.depends_on : std::vector<TaskId>{};
}

auto RunConfig::task_overrides(const TaskId& task) const -> TaskOverrides {
  auto it = tasks_.find(task);
  return it != tasks_.end() ? it->second.overrides : TaskOverrides{};
}

auto ConfigLoader::load_from_file(std::string_view path) -> Result<RunConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<RunConfig> {
  try {
    const YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      return ok(RunConfig{});
    }
    if (!root.IsMap()) {
      log::error("Config must be a mapping of sections");
      return fail(Error::ParseError);
    }

    RunSettings settings;
    if (auto runner = root[std::string(kRunnerSection)];
        runner && !runner.IsNull()) {
      settings = runner.as<RunSettings>();
    }
    if (auto r = validate(settings); !r) {
      return fail(r.error());
    }

    auto env = parse_env(root[std::string(kEnvSection)]);
    if (!env) {
      return fail(env.error());
    }

    std::unordered_map<TaskId, TaskSection> tasks;
    for (const auto& kv : root) {
      auto name = kv.first.as<std::string>();
      if (name == kRunnerSection || name == kEnvSection || kv.second.IsNull()) {
        continue;
      }
      TaskId task_id{name};
      auto section = kv.second.as<TaskSection>();
      if (auto r = validate(task_id, section.overrides); !r) {
        return fail(r.error());
      }
      tasks.emplace(std::move(task_id), std::move(section));
    }

    return ok(RunConfig{root, std::move(settings), std::move(*env),
                        std::move(tasks)});
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace taskrunner
