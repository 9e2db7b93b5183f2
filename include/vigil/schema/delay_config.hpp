#pragma once
#include <vigil/schema/primitives.hpp>

// Schema type: delay config.
// Queue workflow: construction parameters for a fresh queue.
namespace vigil::schema {

/// Shortest non-zero expiration window accepted anywhere.
inline constexpr duration_seconds_t kMinimumExpiration = 60;

template <uint16_t Version>
struct delay_config;

template <>
struct delay_config<1> final {
  uint16_t version{1};
  /// Reported as the initiator of the setup event.
  identity_t deployer{};
  identity_t administrator{};
  identity_t avatar{};
  identity_t target{};
  duration_seconds_t cooldown{};
  duration_seconds_t expiration{};
};

using delay_config_t = delay_config<1>;

}  // namespace vigil::schema
