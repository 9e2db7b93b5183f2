#pragma once

#include <vigil/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: call type.
// Queue workflow: how the executor performs a released action, either as a
// plain call or as a delegate call in the avatar's own context.
namespace vigil::schema {

enum class call_type_t : uint8_t { call = 0, delegate_call = 1 };

template <>
struct enum_names<call_type_t> {
  using entry_t = std::pair<std::string_view, call_type_t>;
  static constexpr auto table =
      std::array{entry_t{"call", call_type_t::call},
                 entry_t{"delegate_call", call_type_t::delegate_call}};
};

inline constexpr std::string_view to_string(const call_type_t value) {
  return try_to_string(value).value_or("unknown");
}

}  // namespace vigil::schema
