#pragma once

#include <vigil/schema/call_type.hpp>
#include <vigil/schema/primitives.hpp>
#include <functional>

namespace vigil::execution {

/// Performs a released action on the avatar's behalf. Returns false when the
/// downstream call failed; may also throw.
using executor_t = std::function<bool(const vigil::schema::identity_t& to,
                                      const vigil::schema::amount_t& value,
                                      const vigil::schema::bytes_view_t& payload,
                                      vigil::schema::call_type_t call_type)>;

/// Current time in seconds since the epoch. Expected to be non-decreasing.
using time_source_t = std::function<vigil::schema::timestamp_seconds_t()>;

}  // namespace vigil::execution
