#pragma once
#include <vigil/schema/primitives.hpp>

// Schema type: queue state.
// Queue workflow: the handful of integers and identities that, together with
// the entry log and the proposer links, make up a whole delay queue.
namespace vigil::schema {

template <uint16_t Version>
struct queue_state;

template <>
struct queue_state<1> final {
  uint16_t version{1};
  /// Next slot eligible for execution or veto.
  uint64_t cursor{};
  /// Next free slot.
  uint64_t tail{};
  /// Entries from `cursor` that may skip the cooldown.
  uint64_t approved{};
  /// Salt handed to the next secret enqueue.
  uint64_t salt{};
  duration_seconds_t cooldown{};
  /// Zero means entries never expire.
  duration_seconds_t expiration{};
  identity_t administrator{};
  identity_t avatar{};
  identity_t target{};
};

using queue_state_t = queue_state<1>;

}  // namespace vigil::schema
