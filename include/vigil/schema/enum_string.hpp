#pragma once

#include <optional>
#include <string_view>

namespace vigil::schema {

/// Specialized beside each enum that has a text form, with a constexpr
/// `table` of name/value pairs. Names are what logs and command lines use.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<std::string_view> try_to_string(const Enum value) {
  for (const auto& [name, candidate] : enum_names<Enum>::table) {
    if (candidate == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view name) {
  for (const auto& [candidate, value] : enum_names<Enum>::table) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace vigil::schema
