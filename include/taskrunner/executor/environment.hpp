#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskrunner {

// Environment handed to every spawned process. Built once per iteration and
// read-only afterwards.
class Environment {
public:
  Environment() = default;

  // Snapshot of this process's environment.
  [[nodiscard]] static auto inherit() -> Environment;

  auto set(std::string key, std::string value) -> void;
  auto overlay(const std::map<std::string, std::string>& vars) -> void;

  [[nodiscard]] auto get(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return vars_.size();
  }

  // KEY=VALUE strings in the layout execve expects.
  [[nodiscard]] auto to_strings() const -> std::vector<std::string>;

private:
  std::map<std::string, std::string, std::less<>> vars_;
};

}  // namespace taskrunner
