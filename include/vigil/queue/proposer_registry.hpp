#pragma once
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/proposer_page.hpp>
#include <vigil/schema/queue_error_code.hpp>
#include <vigil/storage/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace vigil::queue {

/// Set of identities allowed to enqueue, kept as successor links.
///
/// The sentinel is both head and terminator: an empty registry is the single
/// link sentinel -> sentinel. An identity is registered exactly when a link
/// from it exists. New identities are linked directly after the sentinel, so
/// a walk lists the most recently registered first.
///
/// Mutators assume the matching `can_*` check passed and return the links
/// they rewrote, for the caller to persist.
class proposer_registry final {
 public:
  proposer_registry();

  /// Rebuild from persisted links. An empty list yields an empty registry.
  explicit proposer_registry(
      const std::vector<vigil::storage::proposer_link_t>& links);

  bool contains(const vigil::schema::identity_t& proposer) const;
  std::size_t size() const;

  std::optional<vigil::schema::queue_error_code> can_add(
      const vigil::schema::identity_t& proposer) const;
  std::optional<vigil::schema::queue_error_code> can_remove(
      const vigil::schema::identity_t& previous,
      const vigil::schema::identity_t& proposer) const;

  std::vector<vigil::storage::proposer_link_t> add(
      const vigil::schema::identity_t& proposer);
  std::vector<vigil::storage::proposer_link_t> remove(
      const vigil::schema::identity_t& previous,
      const vigil::schema::identity_t& proposer);

  /// Up to `page_size` proposers following `start` (sentinel: from the head).
  ///
  /// `next` is the last identity returned while more remain, and the sentinel
  /// once the walk is exhausted. A zero page size echoes `start`; an
  /// unregistered `start` yields an empty page and the sentinel.
  vigil::schema::proposer_page_t page(const vigil::schema::identity_t& start,
                                      uint64_t page_size) const;

  /// Every link including the sentinel's, for a full rewrite.
  std::vector<vigil::storage::proposer_link_t> links() const;

 private:
  vigil::schema::identity_t successor(
      const vigil::schema::identity_t& proposer) const;

  std::map<vigil::schema::identity_t, vigil::schema::identity_t> links_;
};

}  // namespace vigil::queue
