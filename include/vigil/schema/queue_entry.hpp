#pragma once
#include <vigil/schema/primitives.hpp>

// Schema type: queue entry.
// Queue workflow: immutable slot record written at enqueue time.
namespace vigil::schema {

template <uint16_t Version>
struct queue_entry;

template <>
struct queue_entry<1> final {
  uint16_t version{1};
  hash32_t commitment{};
  timestamp_seconds_t created_at{};
};

using queue_entry_t = queue_entry<1>;

}  // namespace vigil::schema
