#pragma once

#include <vigil/schema/queue_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: queue event.
// Queue workflow: observable record of every state change, returned with the
// operation result and mirrored to the log.
namespace vigil::schema {

inline constexpr std::string_view kDelaySetupEvent{"delay_setup"};
inline constexpr std::string_view kProposerRegisteredEvent{
    "proposer_registered"};
inline constexpr std::string_view kProposerDeregisteredEvent{
    "proposer_deregistered"};
inline constexpr std::string_view kTransactionAddedEvent{"transaction_added"};
inline constexpr std::string_view kSecretTransactionAddedEvent{
    "secret_transaction_added"};
inline constexpr std::string_view kTransactionExecutedEvent{
    "transaction_executed"};
inline constexpr std::string_view kExpiredSkippedEvent{"expired_skipped"};
inline constexpr std::string_view kTransactionsVetoedEvent{
    "transactions_vetoed"};
inline constexpr std::string_view kTransactionsApprovedEvent{
    "transactions_approved"};
inline constexpr std::string_view kCooldownSetEvent{"cooldown_set"};
inline constexpr std::string_view kExpirationSetEvent{"expiration_set"};
inline constexpr std::string_view kAvatarSetEvent{"avatar_set"};
inline constexpr std::string_view kTargetSetEvent{"target_set"};
inline constexpr std::string_view kAdministratorTransferredEvent{
    "administrator_transferred"};

template <uint16_t Version>
struct queue_event;

template <>
struct queue_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<queue_event_attribute_t> attributes;

  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return entry.value;
      }
    }
    return std::nullopt;
  }
};

using queue_event_t = queue_event<1>;

}  // namespace vigil::schema
