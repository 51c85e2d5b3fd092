#pragma once

#include <yaml-cpp/yaml.h>

#include <concepts>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rdaemon {

// Thrown while decoding a well-formed document whose values are out of range.
class ConfigValueError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

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

// Reads an enum spelled as a string; unknown spellings are a
// ConfigValueError rather than a silent default.
template <typename E, typename Parser>
  requires std::invocable<Parser, std::string_view>
[[nodiscard]] auto yaml_get_enum_or(const YAML::Node& node, std::string_view key,
                                    E default_val, Parser parse) -> E {
  auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return default_val;
  }
  auto text = field.as<std::string>();
  std::optional<E> value = parse(text);
  if (!value) {
    throw ConfigValueError(std::format("invalid value '{}' for '{}'", text, key));
  }
  return *value;
}

}  // namespace rdaemon
