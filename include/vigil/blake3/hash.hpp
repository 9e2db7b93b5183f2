#pragma once
#include <blake3.h>
#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace vigil::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const vigil::schema::bytes_view_t& bytes);

  /// Digest of everything fed so far. The hasher stays usable.
  vigil::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace vigil::blake3
