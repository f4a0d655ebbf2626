#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace schemata::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

// Specialized next to each enum, exposing `kNames`: an array of
// enum_name_t<Enum> that lists every enumerator once.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view name) {
  for (const auto& [candidate, value] : enum_names<Enum>::kNames) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::string_view enum_name(const Enum value) {
  for (const auto& [name, candidate] : enum_names<Enum>::kNames) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace schemata::schema
