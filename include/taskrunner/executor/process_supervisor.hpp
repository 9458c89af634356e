#pragma once

#include "taskrunner/core/error.hpp"
#include "taskrunner/executor/environment.hpp"
#include "taskrunner/executor/task_outcome.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace taskrunner {

// Liveness poll cadence when no pidfd is available.
inline constexpr auto kBoundedPollInterval = std::chrono::seconds(1);
inline constexpr auto kUnboundedPollInterval = std::chrono::seconds(20);

class IProcessSupervisor {
public:
  virtual ~IProcessSupervisor() = default;

  // Runs argv to completion or until max_time (0 = no limit) elapses.
  // stdin is /dev/null; stdout and stderr are inherited. On timeout the
  // process gets SIGTERM and Retry is returned at once; the process may
  // still be running at that point. Failing to start the process is an
  // error (SpawnFailed), never an outcome.
  [[nodiscard]] virtual auto run_once(std::span<const std::string> argv,
                                      const Environment& env,
                                      std::chrono::seconds max_time)
      -> Result<TaskOutcome> = 0;
};

// How the supervisor waits for a child. Pidfd blocks on a pidfd and drops to
// Polling only when pidfd_open is unavailable.
enum class WaitMode : std::uint8_t { Pidfd, Polling };

[[nodiscard]] auto create_process_supervisor(WaitMode mode = WaitMode::Pidfd)
    -> std::unique_ptr<IProcessSupervisor>;

}  // namespace taskrunner
