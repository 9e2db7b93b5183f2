#include <vigil/queue/timing_policy.hpp>
#include <limits>

using namespace vigil::schema;

namespace vigil::queue {

timestamp_seconds_t saturating_add(const timestamp_seconds_t lhs,
                                   const duration_seconds_t rhs) {
  if (rhs > std::numeric_limits<timestamp_seconds_t>::max() - lhs) {
    return std::numeric_limits<timestamp_seconds_t>::max();
  }
  return lhs + rhs;
}

bool is_expired(const queue_state_t& state,
                const timestamp_seconds_t created_at,
                const timestamp_seconds_t now) {
  if (state.expiration == 0) {
    return false;
  }
  auto deadline =
      saturating_add(saturating_add(created_at, state.cooldown), state.expiration);
  return deadline < now;
}

std::optional<queue_error_code> admit_next(queue_state_t& state,
                                           const timestamp_seconds_t created_at,
                                           const timestamp_seconds_t now) {
  if (state.cursor == state.tail) {
    return queue_error_code::queue_empty;
  }
  // A clock reading behind the entry counts as zero elapsed time.
  auto age = now > created_at ? now - created_at : timestamp_seconds_t{0};
  if (age < state.cooldown && state.approved == 0) {
    return queue_error_code::still_in_cooldown;
  }
  if (is_expired(state, created_at, now)) {
    return queue_error_code::expired;
  }
  if (state.approved > 0) {
    --state.approved;
  }
  return std::nullopt;
}

}  // namespace vigil::queue
