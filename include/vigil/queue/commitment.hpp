#pragma once
#include <vigil/schema/action.hpp>
#include <vigil/schema/call_type.hpp>
#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace vigil::queue {

inline constexpr std::string_view kCommitmentDomain{"vigil.commitment.v1"};
inline constexpr std::string_view kSecretCommitmentDomain{
    "vigil.secret-commitment.v1"};

/// Commitment a proposer enqueues for a transparent action.
///
/// BLAKE3 over the domain tag followed by the SCALE encoding of
/// (to, value as 32 bytes big endian, payload, call type as one byte).
/// Clients must reproduce this byte for byte; `commitment_builder` does.
vigil::schema::hash32_t commitment_hash(
    const vigil::schema::identity_t& to,
    const vigil::schema::amount_t& value,
    const vigil::schema::bytes_view_t& payload,
    vigil::schema::call_type_t call_type);

vigil::schema::hash32_t commitment_hash(const vigil::schema::action_t& action);

/// As `commitment_hash`, with the salt appended as u64 and a separate domain
/// tag, so a secret commitment never equals a transparent one.
vigil::schema::hash32_t secret_commitment_hash(
    const vigil::schema::identity_t& to,
    const vigil::schema::amount_t& value,
    const vigil::schema::bytes_view_t& payload,
    vigil::schema::call_type_t call_type,
    uint64_t salt);

vigil::schema::hash32_t secret_commitment_hash(
    const vigil::schema::action_t& action,
    uint64_t salt);

}  // namespace vigil::queue
