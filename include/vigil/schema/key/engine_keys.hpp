#pragma once

#include <vigil/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Queue workflow: canonical key prefixes and key codecs for the persisted
// queue state row, the entry log and the proposer links.
namespace vigil::schema::key {

inline constexpr std::string_view kQueueStateKey{"SYS|STATE|QUEUE"};
inline constexpr std::string_view kEntryKeyPrefix{"SYS|STATE|ENTRY|"};
inline constexpr std::string_view kProposerKeyPrefix{"SYS|STATE|PROPOSER|"};

vigil::schema::bytes_t make_queue_state_key();

/// Entry keys embed the slot big endian so a prefix scan walks slot order.
vigil::schema::bytes_t make_entry_key(uint64_t slot);

vigil::schema::bytes_t make_proposer_key(
    const vigil::schema::identity_t& proposer);

vigil::schema::bytes_t make_proposer_prefix();

std::optional<vigil::schema::identity_t> parse_proposer_key(
    const vigil::schema::bytes_view_t& key);

}  // namespace vigil::schema::key
