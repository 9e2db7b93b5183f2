#pragma once
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/queue_entry.hpp>
#include <vigil/schema/queue_state.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::storage {

using key_value_entry_t =
    std::pair<vigil::schema::bytes_t, vigil::schema::bytes_t>;

/// Registry link: proposer -> successor in registry order.
using proposer_link_t =
    std::pair<vigil::schema::identity_t, vigil::schema::identity_t>;

/// Everything one queue operation writes. Applied atomically.
struct change_set final {
  std::optional<vigil::schema::queue_state_t> state;
  std::vector<std::pair<uint64_t, vigil::schema::queue_entry_t>> entries;
  std::vector<proposer_link_t> proposer_links;
  std::vector<vigil::schema::identity_t> removed_proposers;

  bool empty() const {
    return !state.has_value() && entries.empty() && proposer_links.empty() &&
           removed_proposers.empty();
  }
};

template <typename Library>
struct storage {
  /// Load the persisted queue state row, if the queue was ever initialized.
  std::optional<vigil::schema::queue_state_t> load_queue_state() const;

  /// Load the entry written at `slot`.
  std::optional<vigil::schema::queue_entry_t> load_entry(uint64_t slot) const;

  /// Load every registry link, in key order.
  std::vector<proposer_link_t> load_proposer_links() const;

  /// Apply one operation's writes in a single batch.
  void commit(const change_set& changes) const;

  /// Raw rows under `prefix`, in ascending key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const vigil::schema::bytes_view_t& prefix) const;
};

/// Open the backend at `path`, creating it when absent.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace vigil::storage
