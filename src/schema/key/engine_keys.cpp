#include <vigil/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>

namespace vigil::schema::key {

namespace {

bytes_t with_prefix(const std::string_view prefix, const std::size_t extra) {
  auto key = bytes_t{};
  key.reserve(prefix.size() + extra);
  std::copy(std::begin(prefix), std::end(prefix), std::back_inserter(key));
  return key;
}

bool has_prefix(const bytes_view_t& key, const std::string_view prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                    [](const char lhs, const uint8_t rhs) {
                      return static_cast<uint8_t>(lhs) == rhs;
                    });
}

}  // namespace

bytes_t make_queue_state_key() {
  return with_prefix(kQueueStateKey, 0);
}

bytes_t make_entry_key(const uint64_t slot) {
  auto key = with_prefix(kEntryKeyPrefix, sizeof(slot));
  for (auto shift = 56; shift >= 0; shift -= 8) {
    key.push_back(static_cast<uint8_t>(slot >> shift));
  }
  return key;
}

bytes_t make_proposer_key(const identity_t& proposer) {
  auto key = with_prefix(kProposerKeyPrefix, proposer.size());
  key.insert(std::end(key), std::begin(proposer), std::end(proposer));
  return key;
}

bytes_t make_proposer_prefix() {
  return with_prefix(kProposerKeyPrefix, 0);
}

std::optional<identity_t> parse_proposer_key(const bytes_view_t& key) {
  if (key.size() != kProposerKeyPrefix.size() + identity_t{}.size() ||
      !has_prefix(key, kProposerKeyPrefix)) {
    return std::nullopt;
  }
  auto identity = identity_t{};
  std::copy(std::begin(key) +
                static_cast<std::ptrdiff_t>(kProposerKeyPrefix.size()),
            std::end(key), std::begin(identity));
  return identity;
}

}  // namespace vigil::schema::key
