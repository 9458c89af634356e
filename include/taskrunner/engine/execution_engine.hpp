#pragma once

#include "taskrunner/config/config_source.hpp"
#include "taskrunner/config/run_settings.hpp"
#include "taskrunner/core/error.hpp"
#include "taskrunner/engine/run_plan.hpp"
#include "taskrunner/executor/process_supervisor.hpp"
#include "taskrunner/executor/task_outcome.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace taskrunner {

using SleepFunction = std::move_only_function<void(std::chrono::seconds)>;

enum class PassResult : std::uint8_t {
  Success,  // every task returned OK
  Restart,  // a task asked for a retry; run the whole order again
  Halted,   // the halt command ran; the iteration failed
};

[[nodiscard]] constexpr auto to_string_view(PassResult result) noexcept
    -> std::string_view {
  switch (result) {
    case PassResult::Success: return "success";
    case PassResult::Restart: return "restart";
    case PassResult::Halted: return "halted";
  }
  std::unreachable();
}

// Runs the resolved order, restarting it from the first task after a retry.
// The attempt number is shared by all tasks of an iteration and compared
// against each task's own max_tries.
class ExecutionEngine {
public:
  ExecutionEngine(const RunSettings& settings, const ITaskConfigSource& tasks,
                  IProcessSupervisor& supervisor, SleepFunction sleep = {});

  // Attempts passes 1..max_tries. true when a pass succeeded, false when the
  // run halted or ran out of attempts. Errors are fatal (spawn failure of a
  // task, unusable command template).
  [[nodiscard]] auto run(const RunPlan& plan) -> Result<bool>;

  [[nodiscard]] auto run_pass(const RunPlan& plan, int attempt)
      -> Result<PassResult>;

  [[nodiscard]] auto task_command(const RunPlan& plan, const TaskId& task,
                                  const EffectiveTaskConfig& config) const
      -> Result<std::vector<std::string>>;
  // Halt task path, wrapped by the global interpreter.
  [[nodiscard]] auto halt_command(const RunPlan& plan) const
      -> Result<std::vector<std::string>>;

  // JSON handed to the pre/post task hooks.
  [[nodiscard]] auto hook_payload(const TaskId& task, int attempt,
                                  std::optional<TaskOutcome> result) const
      -> std::string;

private:
  auto run_hook(const std::string& hook, const RunPlan& plan,
                const std::string& payload, std::chrono::seconds max_time)
      -> void;
  auto halt(const RunPlan& plan, std::chrono::seconds max_time) -> void;

  const RunSettings& settings_;
  const ITaskConfigSource& tasks_;
  IProcessSupervisor& supervisor_;
  SleepFunction sleep_;
};

}  // namespace taskrunner
