#pragma once

#include <vigil/execution/engine.hpp>
#include <vigil/schema/delay_config.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/storage/rocksdb/storage.hpp>
#include <vigil/testing/common.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::testing {

inline constexpr vigil::schema::timestamp_seconds_t kStartTime = 1'700'000'000;

/// Action as the executor received it.
struct executed_call final {
  vigil::schema::identity_t to;
  vigil::schema::amount_t value;
  vigil::schema::bytes_t payload;
  vigil::schema::call_type_t call_type;
};

inline vigil::schema::delay_config_t make_default_config() {
  return vigil::schema::delay_config_t{.deployer = make_identity(0x10),
                                       .administrator = make_identity(0x20),
                                       .avatar = make_identity(0x30),
                                       .target = make_identity(0x40),
                                       .cooldown = 0,
                                       .expiration = 0x1337};
}

/// Engine over a throwaway RocksDB directory, with a manual clock and an
/// executor that records every call.
class engine_fixture final {
 public:
  explicit engine_fixture(
      const std::string_view db_prefix,
      const vigil::schema::delay_config_t& config = make_default_config())
      : db_path_{make_db_path(db_prefix)},
        config_{config},
        storage_{vigil::storage::make_storage<
            vigil::storage::rocksdb_storage_tag>(db_path_)} {
    engine_.emplace(encoder_, storage_, config_, make_executor(),
                    make_time_source());
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  /// Close the database and open a new engine over the same directory.
  void restart(const vigil::schema::delay_config_t& config) {
    engine_.reset();
    storage_.database.reset();
    storage_ =
        vigil::storage::make_storage<vigil::storage::rocksdb_storage_tag>(
            db_path_);
    engine_.emplace(encoder_, storage_, config, make_executor(),
                    make_time_source());
  }

  void restart() { restart(config_); }

  vigil::execution::engine& engine() { return *engine_; }
  const vigil::execution::engine& engine() const { return *engine_; }

  vigil::storage::storage<vigil::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  const vigil::schema::delay_config_t& config() const { return config_; }
  const vigil::schema::identity_t& administrator() const {
    return config_.administrator;
  }

  /// Register a proposer through the administrator and return it.
  vigil::schema::identity_t add_proposer(const uint8_t seed = 0x50) {
    auto proposer = make_identity(seed);
    auto result = engine_->register_proposer(config_.administrator, proposer);
    if (!result.ok()) {
      throw std::runtime_error{"proposer registration failed: " + result.log};
    }
    return proposer;
  }

  vigil::schema::timestamp_seconds_t now() const { return now_; }
  void advance(const vigil::schema::duration_seconds_t seconds) {
    now_ += seconds;
  }

  void fail_executions(const bool fail) { fail_executions_ = fail; }
  void throw_from_executor(std::string message) {
    executor_error_ = std::move(message);
  }
  /// Runs inside the executor, before it reports.
  void on_execute(std::function<void()> hook) { hook_ = std::move(hook); }

  const std::vector<executed_call>& calls() const { return calls_; }

 private:
  vigil::execution::executor_t make_executor() {
    return [this](const vigil::schema::identity_t& to,
                  const vigil::schema::amount_t& value,
                  const vigil::schema::bytes_view_t& payload,
                  const vigil::schema::call_type_t call_type) {
      calls_.push_back(executed_call{.to = to,
                                     .value = value,
                                     .payload = vigil::schema::make_bytes(payload),
                                     .call_type = call_type});
      if (hook_) {
        hook_();
      }
      if (executor_error_.has_value()) {
        throw std::runtime_error{executor_error_.value()};
      }
      return !fail_executions_;
    };
  }

  vigil::execution::time_source_t make_time_source() {
    return [this] { return now_; };
  }

  std::string db_path_;
  vigil::schema::delay_config_t config_;
  vigil::execution::engine::encoder_t encoder_;
  vigil::storage::storage<vigil::storage::rocksdb_storage_tag> storage_;
  std::optional<vigil::execution::engine> engine_;
  vigil::schema::timestamp_seconds_t now_{kStartTime};
  bool fail_executions_{false};
  std::optional<std::string> executor_error_;
  std::function<void()> hook_;
  std::vector<executed_call> calls_;
};

}  // namespace vigil::testing
