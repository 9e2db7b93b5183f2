#pragma once

#include <vigil/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: queue error code.
// Queue workflow: stable numeric failure taxonomy shared by results, logs and
// the command line tools. Zero is reserved for success.
namespace vigil::schema {

enum class queue_error_code : uint32_t {
  not_authorized = 1,
  invalid_identity = 2,
  already_registered = 3,
  not_registered = 4,
  invalid_previous = 5,
  queue_empty = 6,
  still_in_cooldown = 7,
  expired = 8,
  hash_mismatch = 9,
  execution_failed = 10,
  zero_approval = 11,
  unknown_entries = 12,
  non_increasing_nonce = 13,
  out_of_range = 14,
  invalid_expiration = 15,
  invalid_avatar = 16,
  invalid_target = 17,
};

template <>
struct enum_names<queue_error_code> {
  using entry_t = std::pair<std::string_view, queue_error_code>;
  static constexpr auto table = std::array{
      entry_t{"not_authorized", queue_error_code::not_authorized},
      entry_t{"invalid_identity", queue_error_code::invalid_identity},
      entry_t{"already_registered", queue_error_code::already_registered},
      entry_t{"not_registered", queue_error_code::not_registered},
      entry_t{"invalid_previous", queue_error_code::invalid_previous},
      entry_t{"queue_empty", queue_error_code::queue_empty},
      entry_t{"still_in_cooldown", queue_error_code::still_in_cooldown},
      entry_t{"expired", queue_error_code::expired},
      entry_t{"hash_mismatch", queue_error_code::hash_mismatch},
      entry_t{"execution_failed", queue_error_code::execution_failed},
      entry_t{"zero_approval", queue_error_code::zero_approval},
      entry_t{"unknown_entries", queue_error_code::unknown_entries},
      entry_t{"non_increasing_nonce", queue_error_code::non_increasing_nonce},
      entry_t{"out_of_range", queue_error_code::out_of_range},
      entry_t{"invalid_expiration", queue_error_code::invalid_expiration},
      entry_t{"invalid_avatar", queue_error_code::invalid_avatar},
      entry_t{"invalid_target", queue_error_code::invalid_target}};
};

inline constexpr std::string_view to_string(const queue_error_code value) {
  return try_to_string(value).value_or("unknown");
}

}  // namespace vigil::schema
