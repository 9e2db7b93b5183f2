#pragma once

#include <vigil/schema/action.hpp>
#include <vigil/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace vigil::testing {

/// Deterministic, distinct per seed: byte `i` is `seed + i`.
inline vigil::schema::hash32_t make_hash(const uint8_t seed) {
  auto hash = vigil::schema::hash32_t{};
  auto next = seed;
  for (auto& byte : hash) {
    byte = next++;
  }
  return hash;
}

/// Never the null identity or the sentinel.
inline vigil::schema::identity_t make_identity(const uint8_t seed) {
  auto identity = make_hash(seed);
  identity[0] = 0xA0;
  return identity;
}

inline vigil::schema::action_t make_action(const uint8_t seed) {
  return vigil::schema::action_t{
      .to = make_identity(seed),
      .value = vigil::schema::amount_t{seed},
      .payload = vigil::schema::bytes_t{0xDE, 0xAD, seed},
      .call_type = vigil::schema::call_type_t::call};
}

/// Fresh directory name under the temp dir, unique per process and call.
inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  auto name = std::string{prefix} + "_" + std::to_string(::getpid()) + "_" +
              std::to_string(counter++);
  auto path = std::filesystem::temp_directory_path() / name;
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace vigil::testing
