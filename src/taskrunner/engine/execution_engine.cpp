#include "taskrunner/engine/execution_engine.hpp"

#include "taskrunner/util/log.hpp"
#include "taskrunner/util/shell_words.hpp"

#include <nlohmann/json.hpp>

#include <thread>

namespace taskrunner {

namespace {

// "bash -e" + path -> [bash, -e, path]; no interpreter runs the path itself.
auto wrap_with_interpreter(const std::string& interpreter, std::string path)
    -> Result<std::vector<std::string>> {
  auto words = split_shell_words(interpreter);
  if (!words) {
    log::error("Cannot parse interpreter '{}'", interpreter);
    return fail(words.error());
  }
  words->push_back(std::move(path));
  return words;
}

}  // namespace

ExecutionEngine::ExecutionEngine(const RunSettings& settings,
                                 const ITaskConfigSource& tasks,
                                 IProcessSupervisor& supervisor,
                                 SleepFunction sleep)
    : settings_{settings},
      tasks_{tasks},
      supervisor_{supervisor},
      sleep_{std::move(sleep)} {
  if (!sleep_) {
    sleep_ = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
  }
}

auto ExecutionEngine::run(const RunPlan& plan) -> Result<bool> {
  log::debug("tasks: {}", plan.order.size());
  for (const auto& task : plan.order) {
    log::debug("  {}", task);
  }

  for (int attempt = 1; attempt <= settings_.max_tries; ++attempt) {
    auto result = run_pass(plan, attempt);
    if (!result) {
      return fail(result.error());
    }
    log::trace("attempt {}: {}", attempt, to_string_view(*result));
    switch (*result) {
      case PassResult::Success:
        log::debug("all tasks completed on attempt {}", attempt);
        return true;
      case PassResult::Halted:
        return false;
      case PassResult::Restart:
        break;
    }
  }

  // Reached when a retrying task's own max_tries never matched the counter
  log::warn("giving up after {} attempts", settings_.max_tries);
  return false;
}

auto ExecutionEngine::run_pass(const RunPlan& plan, int attempt)
    -> Result<PassResult> {
  for (const auto& task : plan.order) {
    auto config = resolve_task_config(settings_, tasks_.task_overrides(task));

    if (!settings_.pre_task_hook.empty()) {
      run_hook(settings_.pre_task_hook, plan,
               hook_payload(task, attempt, std::nullopt), config.max_time);
    }

    auto cmd = task_command(plan, task, config);
    if (!cmd) {
      return fail(cmd.error());
    }
    if (!config.interpreter.empty()) {
      log::debug("{}: running with interpreter ({})", task, config.interpreter);
    }
    log::debug("{}: starting attempt {}/{} (max time {}s)", task, attempt,
               config.max_tries, config.max_time.count());

    auto outcome = supervisor_.run_once(*cmd, plan.env, config.max_time);
    if (!outcome) {
      log::error("{}: {}", task, outcome.error().message());
      return fail(outcome.error());
    }
    log::debug("{}: {}", task, to_string_view(*outcome));

    if (!settings_.post_task_hook.empty()) {
      run_hook(settings_.post_task_hook, plan,
               hook_payload(task, attempt, *outcome), settings_.max_time);
    }

    switch (*outcome) {
      case TaskOutcome::Ok:
        continue;

      case TaskOutcome::Retry:
        if (attempt == config.max_tries) {
          log::warn("{}: maximum attempts reached", task);
          halt(plan, config.max_time);
          return PassResult::Halted;
        }
        log::debug("sleeping for {}s", config.sleep_time.count());
        sleep_(config.sleep_time);
        return PassResult::Restart;

      case TaskOutcome::Halt:
        log::info("{}: requested halt", task);
        halt(plan, config.max_time);
        return PassResult::Halted;
    }
  }
  return PassResult::Success;
}

auto ExecutionEngine::task_command(const RunPlan& plan, const TaskId& task,
                                   const EffectiveTaskConfig& config) const
    -> Result<std::vector<std::string>> {
  return wrap_with_interpreter(config.interpreter,
                               (plan.task_dir / task.str()).string());
}

auto ExecutionEngine::halt_command(const RunPlan& plan) const
    -> Result<std::vector<std::string>> {
  return wrap_with_interpreter(settings_.interpreter,
                               (plan.task_dir / settings_.halt_task).string());
}

auto ExecutionEngine::hook_payload(const TaskId& task, int attempt,
                                   std::optional<TaskOutcome> result) const
    -> std::string {
  nlohmann::ordered_json payload = {
      {"task", task.str()},
      {"try_num", attempt},
      {"max_retries", settings_.max_tries},
  };
  if (result) {
    payload["result"] = std::string{to_string_view(*result)};
  }
  return payload.dump();
}

auto ExecutionEngine::run_hook(const std::string& hook, const RunPlan& plan,
                               const std::string& payload,
                               std::chrono::seconds max_time) -> void {
  auto cmd = split_shell_words(hook);
  if (!cmd || cmd->empty()) {
    log::error("Cannot parse hook '{}'", hook);
    return;
  }
  cmd->push_back(payload);
  log::debug("running hook: {}", join_shell_words(*cmd));

  // Hook outcomes are never inspected
  if (auto r = supervisor_.run_once(*cmd, plan.env, max_time); !r) {
    log::error("hook {} failed to start: {}", cmd->front(),
               r.error().message());
  }
}

auto ExecutionEngine::halt(const RunPlan& plan, std::chrono::seconds max_time)
    -> void {
  log::info("halting");
  auto cmd = halt_command(plan);
  if (!cmd) {
    return;
  }
  if (auto r = supervisor_.run_once(*cmd, plan.env, max_time); !r) {
    log::error("halt task {} failed to start: {}", settings_.halt_task,
               r.error().message());
  }
}

}  // namespace taskrunner
