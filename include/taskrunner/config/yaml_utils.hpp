#pragma once

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace taskrunner {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

template <YamlParsable T>
[[nodiscard]] auto yaml_get_optional(const YAML::Node& node,
                                     std::string_view key) -> std::optional<T> {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return std::nullopt;
  }
  return field.as<T>();
}

[[nodiscard]] inline auto yaml_get_seconds_or(const YAML::Node& node,
                                              std::string_view key,
                                              std::chrono::seconds default_val)
    -> std::chrono::seconds {
  return std::chrono::seconds(
      yaml_get_or<long long>(node, key, default_val.count()));
}

}  // namespace taskrunner
