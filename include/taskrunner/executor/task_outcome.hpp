#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

namespace taskrunner {

enum class TaskOutcome : std::uint8_t {
  Ok,
  Retry,
  Halt,
};

// Task exit-code protocol
inline constexpr int kExitOk = 0;
inline constexpr int kExitHalt = 2;

[[nodiscard]] constexpr auto to_string_view(TaskOutcome outcome) noexcept
    -> std::string_view {
  switch (outcome) {
    case TaskOutcome::Ok: return "OK";
    case TaskOutcome::Retry: return "RETRY";
    case TaskOutcome::Halt: return "HALT";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto outcome_from_exit_code(int exit_code) noexcept
    -> TaskOutcome {
  if (exit_code == kExitOk) return TaskOutcome::Ok;
  if (exit_code == kExitHalt) return TaskOutcome::Halt;
  return TaskOutcome::Retry;
}

}  // namespace taskrunner
