#pragma once

#include <vigil/schema/primitives.hpp>
#include <vigil/schema/queue_error_code.hpp>
#include <vigil/schema/queue_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: operation result.
// Queue workflow: outcome envelope of every queue operation. `code` is zero on
// success or a `queue_error_code`; `data` carries SCALE-encoded output such
// as the slot written by an enqueue.
namespace vigil::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<queue_event_t> events;

  bool ok() const { return code == 0; }

  bool failed_with(const queue_error_code error) const {
    return code == static_cast<uint32_t>(error);
  }
};

using operation_result_t = operation_result<1>;

}  // namespace vigil::schema
