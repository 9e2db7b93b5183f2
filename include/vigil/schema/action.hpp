#pragma once
#include <vigil/schema/call_type.hpp>
#include <vigil/schema/primitives.hpp>

// Schema type: action.
// Queue workflow: the side-effecting call a proposer wants the executor to
// perform. Only its commitment is stored; the full action is presented again
// at execution time.
namespace vigil::schema {

template <uint16_t Version>
struct action;

template <>
struct action<1> final {
  uint16_t version{1};
  identity_t to{};
  amount_t value{};
  bytes_t payload;
  call_type_t call_type{call_type_t::call};
};

using action_t = action<1>;

}  // namespace vigil::schema
