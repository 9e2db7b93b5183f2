#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using identity_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);

/// Accepts an optional `0x` prefix and either letter case.
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Lowercase, unprefixed.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// 32-byte big endian rendering of an amount, used in hash preimages.
hash32_t to_big_endian(const amount_t& value);
amount_t from_big_endian(const hash32_t& bytes);
std::optional<amount_t> try_parse_amount(const std::string_view decimal);

/// The null identity (all zero bytes).
identity_t make_null_identity();

/// Registry sentinel: `0x00..01`. Marks both the list head and its end.
identity_t make_sentinel_identity();

bool is_null_identity(const identity_t& identity);
bool is_sentinel_identity(const identity_t& identity);

}  // namespace vigil::schema
