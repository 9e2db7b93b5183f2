#include <boost/algorithm/hex.hpp>
#include <vigil/common/critical.hpp>
#include <vigil/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace vigil::schema {

namespace {

// Widest decimal that can still fit 256 bits.
constexpr std::size_t kMaxAmountDigits = 78;

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.starts_with("0x") || input.starts_with("0X")) {
    input.remove_prefix(2);
  }
  return input;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    vigil::common::critical("expected 32 bytes of hex, got '{}'", hex);
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != hash32_t{}.size()) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex_lower(std::begin(bytes), std::end(bytes),
                              std::back_inserter(out));
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  auto digits = strip_hex_prefix(hex);
  auto out = bytes_t{};
  out.reserve(digits.size() / 2);
  try {
    boost::algorithm::unhex(std::begin(digits), std::end(digits),
                            std::back_inserter(out));
  } catch (const boost::algorithm::hex_decode_error&) {
    return std::nullopt;
  }
  return out;
}

hash32_t to_big_endian(const amount_t& value) {
  auto digits = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(digits), 8);
  auto out = hash32_t{};
  // export_bits emits the minimal width, most significant byte first.
  std::copy(std::begin(digits), std::end(digits),
            std::end(out) - static_cast<std::ptrdiff_t>(digits.size()));
  return out;
}

amount_t from_big_endian(const hash32_t& bytes) {
  auto value = amount_t{};
  boost::multiprecision::import_bits(value, std::begin(bytes), std::end(bytes),
                                     8);
  return value;
}

std::optional<amount_t> try_parse_amount(const std::string_view decimal) {
  if (decimal.empty() || decimal.size() > kMaxAmountDigits) {
    return std::nullopt;
  }
  if (!std::all_of(std::begin(decimal), std::end(decimal), [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return std::nullopt;
  }
  auto wide = boost::multiprecision::cpp_int{std::string{decimal}};
  if (wide > boost::multiprecision::cpp_int{
                 std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return amount_t{wide};
}

identity_t make_null_identity() {
  return {};
}

identity_t make_sentinel_identity() {
  auto sentinel = identity_t{};
  sentinel.back() = 0x01;
  return sentinel;
}

bool is_null_identity(const identity_t& identity) {
  return identity == make_null_identity();
}

bool is_sentinel_identity(const identity_t& identity) {
  return identity == make_sentinel_identity();
}

}  // namespace vigil::schema
