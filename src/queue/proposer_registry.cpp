#include <spdlog/spdlog.h>
#include <vigil/common/critical.hpp>
#include <vigil/queue/proposer_registry.hpp>

using namespace vigil::schema;

namespace vigil::queue {

proposer_registry::proposer_registry() {
  auto sentinel = make_sentinel_identity();
  links_[sentinel] = sentinel;
}

proposer_registry::proposer_registry(
    const std::vector<vigil::storage::proposer_link_t>& links)
    : proposer_registry() {
  for (const auto& [proposer, next] : links) {
    if (is_null_identity(proposer) || is_null_identity(next)) {
      vigil::common::critical("persisted proposer link has a null identity");
    }
    links_[proposer] = next;
  }
  // Every persisted link must be reachable from the head.
  auto reachable = std::size_t{0};
  auto current = successor(make_sentinel_identity());
  while (!is_sentinel_identity(current)) {
    if (++reachable > links_.size()) {
      vigil::common::critical("persisted proposer links contain a cycle");
    }
    current = successor(current);
  }
  if (reachable + 1 != links_.size()) {
    spdlog::error("Proposer registry has {} link(s) but {} reachable",
                  links_.size(), reachable + 1);
    vigil::common::critical("persisted proposer links are inconsistent");
  }
}

identity_t proposer_registry::successor(const identity_t& proposer) const {
  auto it = links_.find(proposer);
  if (it == std::end(links_)) {
    return make_null_identity();
  }
  return it->second;
}

bool proposer_registry::contains(const identity_t& proposer) const {
  if (is_null_identity(proposer) || is_sentinel_identity(proposer)) {
    return false;
  }
  return !is_null_identity(successor(proposer));
}

std::size_t proposer_registry::size() const {
  return links_.size() - 1;
}

std::optional<queue_error_code> proposer_registry::can_add(
    const identity_t& proposer) const {
  if (is_null_identity(proposer) || is_sentinel_identity(proposer)) {
    return queue_error_code::invalid_identity;
  }
  if (contains(proposer)) {
    return queue_error_code::already_registered;
  }
  return std::nullopt;
}

std::optional<queue_error_code> proposer_registry::can_remove(
    const identity_t& previous,
    const identity_t& proposer) const {
  if (is_null_identity(proposer) || is_sentinel_identity(proposer)) {
    return queue_error_code::invalid_identity;
  }
  if (!contains(proposer)) {
    return queue_error_code::not_registered;
  }
  if (successor(previous) != proposer) {
    return queue_error_code::invalid_previous;
  }
  return std::nullopt;
}

std::vector<vigil::storage::proposer_link_t> proposer_registry::add(
    const identity_t& proposer) {
  auto sentinel = make_sentinel_identity();
  auto head = successor(sentinel);
  links_[proposer] = head;
  links_[sentinel] = proposer;
  return {{proposer, head}, {sentinel, proposer}};
}

std::vector<vigil::storage::proposer_link_t> proposer_registry::remove(
    const identity_t& previous,
    const identity_t& proposer) {
  auto next = successor(proposer);
  links_[previous] = next;
  links_.erase(proposer);
  return {{previous, next}};
}

proposer_page_t proposer_registry::page(const identity_t& start,
                                        const uint64_t page_size) const {
  auto result = proposer_page_t{};
  if (page_size == 0) {
    result.next = start;
    return result;
  }
  auto sentinel = make_sentinel_identity();
  if (!is_sentinel_identity(start) && !contains(start)) {
    result.next = sentinel;
    return result;
  }
  auto current = successor(start);
  while (!is_sentinel_identity(current) &&
         result.proposers.size() < page_size) {
    result.proposers.push_back(current);
    current = successor(current);
  }
  result.next = is_sentinel_identity(current) ? sentinel
                                              : result.proposers.back();
  return result;
}

std::vector<vigil::storage::proposer_link_t> proposer_registry::links() const {
  return {std::begin(links_), std::end(links_)};
}

}  // namespace vigil::queue
