#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <vigil/common/critical.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/schema/key/engine_keys.hpp>
#include <vigil/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace vigil::storage {

namespace detail {

using encoder_t =
    vigil::schema::encoding::encoder<vigil::schema::encoding::scale_encoder_tag>;

using queue_state_row_t = std::tuple<uint16_t,
                                     uint64_t,
                                     uint64_t,
                                     uint64_t,
                                     uint64_t,
                                     uint64_t,
                                     uint64_t,
                                     vigil::schema::hash32_t,
                                     vigil::schema::hash32_t,
                                     vigil::schema::hash32_t>;

using queue_entry_row_t =
    std::tuple<uint16_t, vigil::schema::hash32_t, uint64_t>;

inline vigil::schema::bytes_t encode_queue_state(
    const vigil::schema::queue_state_t& state) {
  auto encoder = encoder_t{};
  return encoder.encode(queue_state_row_t{
      state.version, state.cursor, state.tail, state.approved, state.salt,
      state.cooldown, state.expiration, state.administrator, state.avatar,
      state.target});
}

inline std::optional<vigil::schema::queue_state_t> decode_queue_state(
    const vigil::schema::bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<queue_state_row_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto state = vigil::schema::queue_state_t{};
  std::tie(state.version, state.cursor, state.tail, state.approved,
           state.salt, state.cooldown, state.expiration, state.administrator,
           state.avatar, state.target) = decoded.value();
  return state;
}

inline vigil::schema::bytes_t encode_queue_entry(
    const vigil::schema::queue_entry_t& entry) {
  auto encoder = encoder_t{};
  return encoder.encode(
      queue_entry_row_t{entry.version, entry.commitment, entry.created_at});
}

inline std::optional<vigil::schema::queue_entry_t> decode_queue_entry(
    const vigil::schema::bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<queue_entry_row_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto entry = vigil::schema::queue_entry_t{};
  std::tie(entry.version, entry.commitment, entry.created_at) = decoded.value();
  return entry;
}

inline vigil::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const vigil::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline vigil::schema::bytes_view_t to_view(const std::string& raw) {
  return vigil::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(raw.data()), raw.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<vigil::schema::queue_state_t> load_queue_state() const;
  std::optional<vigil::schema::queue_entry_t> load_entry(uint64_t slot) const;
  std::vector<proposer_link_t> load_proposer_links() const;
  void commit(const change_set& changes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const vigil::schema::bytes_view_t& prefix) const;

 private:
  std::optional<std::string> read_raw(
      const vigil::schema::bytes_view_t& key) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<std::string> storage<rocksdb_storage_tag>::read_raw(
    const vigil::schema::bytes_view_t& key) const {
  if (!database) {
    vigil::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    vigil::common::critical("RocksDB get failed: {}", status.ToString());
  }
  return value;
}

inline std::optional<vigil::schema::queue_state_t>
storage<rocksdb_storage_tag>::load_queue_state() const {
  auto raw = read_raw(vigil::schema::key::make_queue_state_key());
  if (!raw.has_value()) {
    return std::nullopt;
  }
  auto state = detail::decode_queue_state(detail::to_view(raw.value()));
  if (!state.has_value()) {
    vigil::common::critical("failed to decode queue state");
  }
  return state;
}

inline std::optional<vigil::schema::queue_entry_t>
storage<rocksdb_storage_tag>::load_entry(const uint64_t slot) const {
  auto raw = read_raw(vigil::schema::key::make_entry_key(slot));
  if (!raw.has_value()) {
    return std::nullopt;
  }
  auto entry = detail::decode_queue_entry(detail::to_view(raw.value()));
  if (!entry.has_value()) {
    vigil::common::critical("queue entry at slot {} is corrupt", slot);
  }
  return entry;
}

inline std::vector<proposer_link_t>
storage<rocksdb_storage_tag>::load_proposer_links() const {
  auto links = std::vector<proposer_link_t>{};
  auto encoder = detail::encoder_t{};
  for (const auto& [key, value] :
       list_by_prefix(vigil::schema::key::make_proposer_prefix())) {
    auto proposer = vigil::schema::key::parse_proposer_key(key);
    if (!proposer.has_value()) {
      spdlog::warn("Skipping malformed proposer key '{}'",
                   vigil::schema::to_hex(key));
      continue;
    }
    auto successor = encoder.try_decode<vigil::schema::identity_t>(value);
    if (!successor.has_value()) {
      vigil::common::critical("link for proposer {} is corrupt",
                              vigil::schema::to_hex(proposer.value()));
    }
    links.emplace_back(proposer.value(), successor.value());
  }
  return links;
}

inline void storage<rocksdb_storage_tag>::commit(
    const change_set& changes) const {
  if (!database) {
    vigil::common::critical("RocksDB database is not initialized");
  }
  if (changes.empty()) {
    return;
  }

  auto encoder = detail::encoder_t{};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto stage = [&batch](const vigil::schema::bytes_t& key,
                        const vigil::schema::bytes_t& value) {
    auto status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      vigil::common::critical("failed staging write batch entry");
    }
  };

  if (changes.state.has_value()) {
    stage(vigil::schema::key::make_queue_state_key(),
          detail::encode_queue_state(changes.state.value()));
  }
  for (const auto& [slot, entry] : changes.entries) {
    stage(vigil::schema::key::make_entry_key(slot),
          detail::encode_queue_entry(entry));
  }
  for (const auto& [proposer, successor] : changes.proposer_links) {
    stage(vigil::schema::key::make_proposer_key(proposer),
          encoder.encode(successor));
  }
  for (const auto& proposer : changes.removed_proposers) {
    auto key = vigil::schema::key::make_proposer_key(proposer);
    auto status = batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      vigil::common::critical("failed staging proposer removal");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    vigil::common::critical("failed to commit queue changes: {}",
                            status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const vigil::schema::bytes_view_t& prefix) const {
  if (!database) {
    vigil::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace vigil::storage
