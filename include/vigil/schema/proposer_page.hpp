#pragma once
#include <vigil/schema/primitives.hpp>
#include <vector>

// Schema type: proposer page.
// Queue workflow: one page of a registry walk plus the cursor to resume from.
namespace vigil::schema {

template <uint16_t Version>
struct proposer_page;

template <>
struct proposer_page<1> final {
  uint16_t version{1};
  std::vector<identity_t> proposers;
  /// Sentinel once the walk is exhausted.
  identity_t next{};
};

using proposer_page_t = proposer_page<1>;

}  // namespace vigil::schema
