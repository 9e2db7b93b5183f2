#pragma once

#include <vigil/execution/executor.hpp>
#include <vigil/execution/setup_error.hpp>
#include <vigil/queue/proposer_registry.hpp>
#include <vigil/schema/action.hpp>
#include <vigil/schema/delay_config.hpp>
#include <vigil/schema/encoding/encoder.hpp>
#include <vigil/schema/operation_result.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/proposer_page.hpp>
#include <vigil/schema/queue_entry.hpp>
#include <vigil/schema/queue_error_code.hpp>
#include <vigil/schema/queue_event.hpp>
#include <vigil/schema/queue_state.hpp>
#include <vigil/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vigil::execution {

/// Delayed-execution queue.
///
/// Registered proposers append commitments; after the cooldown, or once the
/// administrator approves them, anyone may release the entry at the cursor by
/// presenting the action that hashes to the stored commitment. The
/// administrator can veto pending entries by moving the cursor forward.
///
/// Every successful operation is committed to storage as one batch before it
/// returns. Failed operations leave memory and storage untouched, with one
/// exception: when the executor fails, the released slot stays consumed.
///
/// The engine takes no lock. Operations are expected to be serialized by the
/// caller; the executor may call back into the engine while an execution is
/// in flight and observes the already advanced cursor.
class engine final {
 public:
  using encoder_t = vigil::schema::encoding::encoder<
      vigil::schema::encoding::scale_encoder_tag>;
  using storage_t =
      vigil::storage::storage<vigil::storage::rocksdb_storage_tag>;

  /// Restore the queue persisted in `storage`, or create a fresh one from
  /// `config` when storage is empty. `config` is ignored when restoring.
  ///
  /// Throws `setup_error` when a fresh queue's configuration is invalid.
  engine(encoder_t& encoder,
         storage_t& storage,
         const vigil::schema::delay_config_t& config,
         executor_t executor,
         time_source_t time_source);

  /// Event emitted when this instance created the queue; empty on restore.
  const std::optional<vigil::schema::queue_event_t>& setup_event() const;
  bool restored() const;

  // Proposer registry.
  vigil::schema::operation_result_t register_proposer(
      const vigil::schema::identity_t& caller,
      const vigil::schema::identity_t& proposer);
  vigil::schema::operation_result_t deregister_proposer(
      const vigil::schema::identity_t& caller,
      const vigil::schema::identity_t& previous,
      const vigil::schema::identity_t& proposer);
  bool is_proposer(const vigil::schema::identity_t& proposer) const;
  vigil::schema::proposer_page_t list_proposers(
      const vigil::schema::identity_t& start,
      uint64_t page_size) const;

  // Commitment queue. Result data is the SCALE-encoded u64 slot.
  vigil::schema::operation_result_t enqueue(
      const vigil::schema::identity_t& caller,
      const vigil::schema::hash32_t& commitment);
  /// Hashes `action` on the proposer's behalf and publishes it in the event.
  vigil::schema::operation_result_t enqueue_action(
      const vigil::schema::identity_t& caller,
      const vigil::schema::action_t& action);
  /// `note` is published with the event and otherwise ignored.
  vigil::schema::operation_result_t enqueue_secret(
      const vigil::schema::identity_t& caller,
      const vigil::schema::hash32_t& commitment,
      std::string_view note);

  // Execution gate. Open to any caller.
  vigil::schema::operation_result_t execute_next(
      const vigil::schema::action_t& action);
  vigil::schema::operation_result_t execute_next_secret(
      const vigil::schema::action_t& action,
      uint64_t salt);
  /// Move the cursor past every expired entry at the head. Never fails.
  vigil::schema::operation_result_t skip_expired();

  // Override protocol.
  vigil::schema::operation_result_t veto_up_to(
      const vigil::schema::identity_t& caller,
      uint64_t new_cursor);
  vigil::schema::operation_result_t veto_up_to_and_approve(
      const vigil::schema::identity_t& caller,
      uint64_t new_cursor,
      uint64_t count);
  vigil::schema::operation_result_t approve_next(
      const vigil::schema::identity_t& caller,
      uint64_t count);

  // Administration.
  vigil::schema::operation_result_t set_cooldown(
      const vigil::schema::identity_t& caller,
      vigil::schema::duration_seconds_t cooldown);
  vigil::schema::operation_result_t set_expiration(
      const vigil::schema::identity_t& caller,
      vigil::schema::duration_seconds_t expiration);
  vigil::schema::operation_result_t set_avatar(
      const vigil::schema::identity_t& caller,
      const vigil::schema::identity_t& avatar);
  vigil::schema::operation_result_t set_target(
      const vigil::schema::identity_t& caller,
      const vigil::schema::identity_t& target);
  vigil::schema::operation_result_t transfer_administrator(
      const vigil::schema::identity_t& caller,
      const vigil::schema::identity_t& administrator);

  // Views.
  uint64_t cursor() const;
  uint64_t tail() const;
  uint64_t approved_count() const;
  uint64_t salt_counter() const;
  vigil::schema::duration_seconds_t cooldown() const;
  vigil::schema::duration_seconds_t expiration() const;
  const vigil::schema::identity_t& administrator() const;
  const vigil::schema::identity_t& avatar() const;
  const vigil::schema::identity_t& target() const;
  /// Zero hash for a slot that was never written.
  vigil::schema::hash32_t commitment_at(uint64_t slot) const;
  /// Zero for a slot that was never written.
  vigil::schema::timestamp_seconds_t created_at_of(uint64_t slot) const;
  const vigil::schema::queue_state_t& state() const;

 private:
  /// Append `commitment` at the tail and persist it together with `next`.
  uint64_t append(vigil::schema::queue_state_t next,
                  const vigil::schema::hash32_t& commitment);

  /// Release the entry at the cursor if `presented` matches its commitment.
  vigil::schema::operation_result_t release(
      const vigil::schema::action_t& action,
      const vigil::schema::hash32_t& presented);

  /// Persist `next` (plus any extra writes in `changes`) and adopt it.
  void apply(vigil::schema::queue_state_t next,
             vigil::storage::change_set changes = {});

  bool is_administrator(const vigil::schema::identity_t& caller) const;
  void load_persisted_state();
  void create(const vigil::schema::delay_config_t& config);

  encoder_t& encoder_;
  storage_t& storage_;
  executor_t executor_;
  time_source_t time_source_;
  vigil::schema::queue_state_t state_;
  vigil::queue::proposer_registry registry_;
  std::optional<vigil::schema::queue_event_t> setup_event_;
  bool restored_{false};
};

}  // namespace vigil::execution
