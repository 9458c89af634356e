#pragma once

#include "taskrunner/config/config_source.hpp"
#include "taskrunner/config/run_settings.hpp"
#include "taskrunner/core/error.hpp"
#include "taskrunner/engine/execution_engine.hpp"
#include "taskrunner/engine/run_plan.hpp"
#include "taskrunner/executor/process_supervisor.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace taskrunner {

class RunDriver {
public:
  RunDriver(const RunSettings& settings, const ITaskConfigSource& tasks,
            std::map<std::string, std::string> env_overlay,
            IProcessSupervisor& supervisor, SleepFunction sleep = {});

  // Lists the task directory, drops the halt task and resolves the order.
  [[nodiscard]] auto prepare(const std::filesystem::path& task_dir) const
      -> Result<RunPlan>;

  // Runs `times` iterations, forever when unset or 0. Stops at the first
  // iteration that fails; a halted or exhausted run is Error::Halted.
  [[nodiscard]] auto run(const std::filesystem::path& task_dir,
                         std::optional<int> times) -> Result<void>;

  // Iterations started so far, including a failed last one.
  [[nodiscard]] auto iterations() const noexcept -> std::uint64_t {
    return iterations_;
  }

private:
  const RunSettings& settings_;
  const ITaskConfigSource& tasks_;
  std::map<std::string, std::string> env_overlay_;
  ExecutionEngine engine_;
  std::uint64_t iterations_{0};
};

}  // namespace taskrunner
