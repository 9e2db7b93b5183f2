#pragma once

#include <cstdint>
#include <string>

// Schema type: queue event attribute.
// Queue workflow: key/value/index tuple carried by queue events.
namespace vigil::schema {

template <uint16_t Version>
struct queue_event_attribute;

template <>
struct queue_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using queue_event_attribute_t = queue_event_attribute<1>;

}  // namespace vigil::schema
