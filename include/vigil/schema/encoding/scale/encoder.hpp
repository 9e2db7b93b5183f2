#pragma once
#include <vigil/common/critical.hpp>
#include <vigil/schema/encoding/encoder.hpp>
#include <vigil/schema/primitives.hpp>
#include <iterator>
#include <optional>
#include <scale/scale.hpp>
#include <string_view>
#include <utility>

namespace vigil::schema::encoding {

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  vigil::schema::bytes_t encode(const T& value) {
    auto out = vigil::schema::bytes_t{};
    append(value, out);
    return out;
  }

  /// Appends the encoding of `value` to `out`, keeping what is already there.
  template <typename T>
  void append(const T& value, vigil::schema::bytes_t& out) {
    auto encoded = ::scale::impl::memory::encode(value);
    if (!encoded) {
      vigil::common::critical("SCALE encoding failed after {} byte(s)",
                              out.size());
    }
    out.insert(std::end(out), std::begin(encoded.value()),
               std::end(encoded.value()));
  }

  template <typename T>
  std::optional<T> try_decode(const vigil::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }

  /// Terminates when `bytes` do not hold a `T`; `what` names it in the log.
  template <typename T>
  T decode(const vigil::schema::bytes_view_t& bytes,
           const std::string_view what = "value") {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      vigil::common::critical("cannot decode {} from {} byte(s)", what,
                              bytes.size());
    }
    return std::move(decoded.value());
  }
};

}  // namespace vigil::schema::encoding
