#include "taskrunner/executor/environment.hpp"

#include <unistd.h>

extern char** environ;

namespace taskrunner {

auto Environment::inherit() -> Environment {
  Environment env;
  for (char** p = environ; p != nullptr && *p != nullptr; ++p) {
    std::string_view entry{*p};
    auto eq = entry.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    env.vars_.emplace(std::string{entry.substr(0, eq)},
                      std::string{entry.substr(eq + 1)});
  }
  return env;
}

auto Environment::set(std::string key, std::string value) -> void {
  vars_.insert_or_assign(std::move(key), std::move(value));
}

auto Environment::overlay(const std::map<std::string, std::string>& vars)
    -> void {
  for (const auto& [key, value] : vars) {
    vars_.insert_or_assign(key, value);
  }
}

auto Environment::get(std::string_view key) const
    -> std::optional<std::string> {
  auto it = vars_.find(key);
  if (it == vars_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto Environment::to_strings() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(vars_.size());
  for (const auto& [key, value] : vars_) {
    out.push_back(key + "=" + value);
  }
  return out;
}

}  // namespace taskrunner
