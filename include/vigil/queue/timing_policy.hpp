#pragma once
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/queue_error_code.hpp>
#include <vigil/schema/queue_state.hpp>
#include <optional>

namespace vigil::queue {

/// Addition clamped at the largest timestamp.
vigil::schema::timestamp_seconds_t saturating_add(
    vigil::schema::timestamp_seconds_t lhs,
    vigil::schema::duration_seconds_t rhs);

/// Whether an entry created at `created_at` is past its execution window.
/// Never true while `state.expiration` is zero.
bool is_expired(const vigil::schema::queue_state_t& state,
                vigil::schema::timestamp_seconds_t created_at,
                vigil::schema::timestamp_seconds_t now);

/// Admission check for the entry at `state.cursor`.
///
/// Fails with queue_empty, then still_in_cooldown (unless an approval credit
/// is pending), then expired. The expiry check runs after the approval
/// bypass, so an approved entry can still be expired.
///
/// Side effect: on success one approval credit, if any, is consumed from
/// `state`. Callers that may still reject the entry afterwards must run this
/// on a staged copy of the state.
std::optional<vigil::schema::queue_error_code> admit_next(
    vigil::schema::queue_state_t& state,
    vigil::schema::timestamp_seconds_t created_at,
    vigil::schema::timestamp_seconds_t now);

}  // namespace vigil::queue
