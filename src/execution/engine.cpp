#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vigil/common/critical.hpp>
#include <vigil/execution/engine.hpp>
#include <vigil/queue/commitment.hpp>
#include <vigil/queue/timing_policy.hpp>

using namespace vigil::schema;

namespace {

inline constexpr std::string_view kRegistryCodespace{"vigil.registry"};
inline constexpr std::string_view kQueueCodespace{"vigil.queue"};
inline constexpr std::string_view kExecuteCodespace{"vigil.execute"};
inline constexpr std::string_view kOverrideCodespace{"vigil.override"};
inline constexpr std::string_view kConfigCodespace{"vigil.config"};

std::string_view describe(const queue_error_code code) {
  switch (code) {
    case queue_error_code::not_authorized:
      return "caller is not authorized";
    case queue_error_code::invalid_identity:
      return "identity cannot be null or the sentinel";
    case queue_error_code::already_registered:
      return "proposer already registered";
    case queue_error_code::not_registered:
      return "proposer not registered";
    case queue_error_code::invalid_previous:
      return "previous proposer does not link to proposer";
    case queue_error_code::queue_empty:
      return "transaction queue is empty";
    case queue_error_code::still_in_cooldown:
      return "transaction is still in cooldown";
    case queue_error_code::expired:
      return "transaction expired";
    case queue_error_code::hash_mismatch:
      return "transaction hashes do not match";
    case queue_error_code::execution_failed:
      return "executor call failed";
    case queue_error_code::zero_approval:
      return "must approve at least one transaction";
    case queue_error_code::unknown_entries:
      return "cannot approve unknown transactions";
    case queue_error_code::non_increasing_nonce:
      return "new cursor must be higher than the current cursor";
    case queue_error_code::out_of_range:
      return "new cursor cannot be higher than the tail";
    case queue_error_code::invalid_expiration:
      return "expiration must be 0 or at least 60 seconds";
    case queue_error_code::invalid_avatar:
      return "avatar cannot be the null identity";
    case queue_error_code::invalid_target:
      return "target cannot be the null identity";
  }
  return "unknown error";
}

operation_result_t make_failure(const queue_error_code code,
                                const std::string_view codespace,
                                std::string info = {}) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{describe(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  spdlog::debug("Rejected {} operation: {}", codespace, to_string(code));
  return result;
}

operation_result_t make_success(const std::string_view codespace,
                                std::vector<queue_event_t> events) {
  auto result = operation_result_t{};
  result.codespace = std::string{codespace};
  result.events = std::move(events);
  return result;
}

queue_event_attribute_t make_attribute(std::string key,
                                       std::string value,
                                       const bool index = false) {
  return queue_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

queue_event_t make_event(const std::string_view type,
                         std::vector<queue_event_attribute_t> attributes) {
  return queue_event_t{.type = std::string{type},
                       .attributes = std::move(attributes)};
}

/// Move the cursor forward, forfeiting approval credits for the skipped
/// entries. Credits never go below zero.
queue_event_t veto(queue_state_t& state, const uint64_t new_cursor) {
  auto old_cursor = state.cursor;
  auto delta = new_cursor - old_cursor;
  state.approved = delta >= state.approved ? 0 : state.approved - delta;
  state.cursor = new_cursor;
  spdlog::info("Vetoed {} transaction(s) from slot {}", delta, old_cursor);
  return make_event(kTransactionsVetoedEvent,
                    {make_attribute("cursor", std::to_string(old_cursor), true),
                     make_attribute("count", std::to_string(delta))});
}

queue_event_t approve(queue_state_t& state, const uint64_t count) {
  state.approved = count;
  spdlog::info("Approved {} transaction(s) from slot {}", count, state.cursor);
  return make_event(
      kTransactionsApprovedEvent,
      {make_attribute("cursor", std::to_string(state.cursor), true),
       make_attribute("count", std::to_string(count))});
}

}  // namespace

namespace vigil::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const delay_config_t& config,
               executor_t executor,
               time_source_t time_source)
    : encoder_{encoder},
      storage_{storage},
      executor_{std::move(executor)},
      time_source_{std::move(time_source)} {
  if (!executor_ || !time_source_) {
    throw std::invalid_argument{"engine requires an executor and a clock"};
  }
  load_persisted_state();
  if (!restored_) {
    create(config);
  }
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted queue state");
  auto persisted = storage_.load_queue_state();
  if (!persisted.has_value()) {
    return;
  }
  if (persisted->cursor > persisted->tail ||
      persisted->approved > persisted->tail - persisted->cursor) {
    vigil::common::critical("persisted queue state violates its bounds");
  }
  state_ = persisted.value();
  registry_ = vigil::queue::proposer_registry{storage_.load_proposer_links()};
  restored_ = true;
  spdlog::info(
      "Restored queue at cursor {} tail {} with {} proposer(s); construction "
      "config ignored",
      state_.cursor, state_.tail, registry_.size());
}

void engine::create(const delay_config_t& config) {
  auto reject = [](const queue_error_code code) {
    spdlog::error("Queue setup rejected: {}", describe(code));
    throw setup_error{code, std::string{describe(code)}};
  };
  if (is_null_identity(config.avatar)) {
    reject(queue_error_code::invalid_avatar);
  }
  if (is_null_identity(config.target)) {
    reject(queue_error_code::invalid_target);
  }
  if (config.expiration != 0 && config.expiration < kMinimumExpiration) {
    reject(queue_error_code::invalid_expiration);
  }
  if (is_null_identity(config.administrator)) {
    reject(queue_error_code::invalid_identity);
  }

  auto next = queue_state_t{};
  next.cooldown = config.cooldown;
  next.expiration = config.expiration;
  next.administrator = config.administrator;
  next.avatar = config.avatar;
  next.target = config.target;

  auto changes = vigil::storage::change_set{};
  changes.proposer_links = registry_.links();
  apply(next, std::move(changes));

  setup_event_ = make_event(
      kDelaySetupEvent,
      {make_attribute("initiator", to_hex(config.deployer), true),
       make_attribute("administrator", to_hex(config.administrator), true),
       make_attribute("avatar", to_hex(config.avatar), true),
       make_attribute("target", to_hex(config.target))});
  spdlog::info("Created queue with cooldown {}s and expiration {}s",
               state_.cooldown, state_.expiration);
}

const std::optional<queue_event_t>& engine::setup_event() const {
  return setup_event_;
}

bool engine::restored() const {
  return restored_;
}

void engine::apply(queue_state_t next, vigil::storage::change_set changes) {
  changes.state = next;
  storage_.commit(changes);
  state_ = std::move(next);
}

bool engine::is_administrator(const identity_t& caller) const {
  return caller == state_.administrator;
}

operation_result_t engine::register_proposer(const identity_t& caller,
                                             const identity_t& proposer) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kRegistryCodespace);
  }
  if (auto error = registry_.can_add(proposer)) {
    return make_failure(error.value(), kRegistryCodespace);
  }
  auto changes = vigil::storage::change_set{};
  changes.proposer_links = registry_.add(proposer);
  apply(state_, std::move(changes));
  spdlog::info("Registered proposer {}", to_hex(proposer));
  return make_success(
      kRegistryCodespace,
      {make_event(kProposerRegisteredEvent,
                  {make_attribute("proposer", to_hex(proposer), true)})});
}

operation_result_t engine::deregister_proposer(const identity_t& caller,
                                               const identity_t& previous,
                                               const identity_t& proposer) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kRegistryCodespace);
  }
  if (auto error = registry_.can_remove(previous, proposer)) {
    return make_failure(error.value(), kRegistryCodespace);
  }
  auto changes = vigil::storage::change_set{};
  changes.proposer_links = registry_.remove(previous, proposer);
  changes.removed_proposers.push_back(proposer);
  apply(state_, std::move(changes));
  spdlog::info("Deregistered proposer {}", to_hex(proposer));
  return make_success(
      kRegistryCodespace,
      {make_event(kProposerDeregisteredEvent,
                  {make_attribute("proposer", to_hex(proposer), true)})});
}

bool engine::is_proposer(const identity_t& proposer) const {
  return registry_.contains(proposer);
}

proposer_page_t engine::list_proposers(const identity_t& start,
                                       const uint64_t page_size) const {
  return registry_.page(start, page_size);
}

uint64_t engine::append(queue_state_t next, const hash32_t& commitment) {
  auto slot = next.tail;
  ++next.tail;
  auto changes = vigil::storage::change_set{};
  changes.entries.emplace_back(
      slot,
      queue_entry_t{.commitment = commitment, .created_at = time_source_()});
  apply(std::move(next), std::move(changes));
  spdlog::info("Enqueued commitment {} at slot {}", to_hex(commitment), slot);
  return slot;
}

operation_result_t engine::enqueue(const identity_t& caller,
                                   const hash32_t& commitment) {
  if (!registry_.contains(caller)) {
    return make_failure(queue_error_code::not_authorized, kQueueCodespace);
  }
  auto slot = append(state_, commitment);
  auto result = make_success(
      kQueueCodespace,
      {make_event(kTransactionAddedEvent,
                  {make_attribute("slot", std::to_string(slot), true),
                   make_attribute("commitment", to_hex(commitment))})});
  result.data = encoder_.encode(slot);
  return result;
}

operation_result_t engine::enqueue_action(const identity_t& caller,
                                          const action_t& action) {
  if (!registry_.contains(caller)) {
    return make_failure(queue_error_code::not_authorized, kQueueCodespace);
  }
  auto commitment = vigil::queue::commitment_hash(action);
  auto slot = append(state_, commitment);
  auto result = make_success(
      kQueueCodespace,
      {make_event(
          kTransactionAddedEvent,
          {make_attribute("slot", std::to_string(slot), true),
           make_attribute("commitment", to_hex(commitment)),
           make_attribute("to", to_hex(action.to)),
           make_attribute("value", action.value.str()),
           make_attribute("payload", to_hex(make_bytes_view(action.payload))),
           make_attribute("call_type",
                          std::string{to_string(action.call_type)})})});
  result.data = encoder_.encode(slot);
  return result;
}

operation_result_t engine::enqueue_secret(const identity_t& caller,
                                          const hash32_t& commitment,
                                          const std::string_view note) {
  if (!registry_.contains(caller)) {
    return make_failure(queue_error_code::not_authorized, kQueueCodespace);
  }
  auto next = state_;
  auto salt = next.salt;
  ++next.salt;
  auto slot = append(std::move(next), commitment);
  auto result = make_success(
      kQueueCodespace,
      {make_event(kSecretTransactionAddedEvent,
                  {make_attribute("slot", std::to_string(slot), true),
                   make_attribute("commitment", to_hex(commitment)),
                   make_attribute("salt", std::to_string(salt)),
                   make_attribute("note", std::string{note})})});
  result.data = encoder_.encode(slot);
  return result;
}

operation_result_t engine::execute_next(const action_t& action) {
  return release(action, vigil::queue::commitment_hash(action));
}

operation_result_t engine::execute_next_secret(const action_t& action,
                                               const uint64_t salt) {
  return release(action, vigil::queue::secret_commitment_hash(action, salt));
}

operation_result_t engine::release(const action_t& action,
                                   const hash32_t& presented) {
  auto next = state_;
  auto stored = make_zero_hash();
  auto created_at = timestamp_seconds_t{0};
  if (next.cursor < next.tail) {
    auto entry = storage_.load_entry(next.cursor);
    if (!entry.has_value()) {
      vigil::common::critical("queue entry below the tail is missing");
    }
    stored = entry->commitment;
    created_at = entry->created_at;
  }

  if (auto error = vigil::queue::admit_next(next, created_at, time_source_())) {
    return make_failure(error.value(), kExecuteCodespace);
  }
  if (stored != presented) {
    return make_failure(queue_error_code::hash_mismatch, kExecuteCodespace);
  }

  // The slot is consumed before the executor runs, whatever it reports.
  auto slot = next.cursor;
  ++next.cursor;
  apply(std::move(next));

  spdlog::info("Releasing slot {} to {}", slot, to_hex(action.to));
  auto succeeded = false;
  auto info = std::string{};
  try {
    succeeded = executor_(action.to, action.value,
                          make_bytes_view(action.payload), action.call_type);
  } catch (const std::exception& ex) {
    info = ex.what();
  }
  if (!succeeded) {
    spdlog::warn("Executor failed for slot {}: {}", slot,
                 info.empty() ? "call reported failure" : info);
    return make_failure(queue_error_code::execution_failed, kExecuteCodespace,
                        std::move(info));
  }
  return make_success(
      kExecuteCodespace,
      {make_event(kTransactionExecutedEvent,
                  {make_attribute("slot", std::to_string(slot), true)})});
}

operation_result_t engine::skip_expired() {
  auto next = state_;
  auto now = time_source_();
  auto from = next.cursor;
  while (next.expiration != 0 && next.cursor < next.tail) {
    auto entry = storage_.load_entry(next.cursor);
    if (!entry.has_value()) {
      vigil::common::critical("queue entry below the tail is missing");
    }
    if (!vigil::queue::is_expired(next, entry->created_at, now)) {
      break;
    }
    ++next.cursor;
  }
  if (next.cursor == from) {
    return make_success(kExecuteCodespace, {});
  }

  auto count = next.cursor - from;
  next.approved = std::min(next.approved, next.tail - next.cursor);
  apply(std::move(next));
  spdlog::info("Skipped {} expired transaction(s) from slot {}", count, from);
  return make_success(
      kExecuteCodespace,
      {make_event(kExpiredSkippedEvent,
                  {make_attribute("cursor", std::to_string(from), true),
                   make_attribute("count", std::to_string(count))})});
}

operation_result_t engine::veto_up_to(const identity_t& caller,
                                      const uint64_t new_cursor) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kOverrideCodespace);
  }
  if (new_cursor <= state_.cursor) {
    return make_failure(queue_error_code::non_increasing_nonce,
                        kOverrideCodespace);
  }
  if (new_cursor > state_.tail) {
    return make_failure(queue_error_code::out_of_range, kOverrideCodespace);
  }
  auto next = state_;
  auto event = veto(next, new_cursor);
  apply(std::move(next));
  return make_success(kOverrideCodespace, {std::move(event)});
}

operation_result_t engine::veto_up_to_and_approve(const identity_t& caller,
                                                  const uint64_t new_cursor,
                                                  const uint64_t count) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kOverrideCodespace);
  }
  auto landing = std::max(new_cursor, state_.cursor);
  if (landing > state_.tail) {
    return make_failure(queue_error_code::out_of_range, kOverrideCodespace);
  }
  if (count == 0) {
    return make_failure(queue_error_code::zero_approval, kOverrideCodespace);
  }
  if (count > state_.tail - landing) {
    return make_failure(queue_error_code::unknown_entries, kOverrideCodespace);
  }

  auto next = state_;
  auto events = std::vector<queue_event_t>{};
  if (new_cursor > next.cursor) {
    events.push_back(veto(next, new_cursor));
  }
  events.push_back(approve(next, count));
  apply(std::move(next));
  return make_success(kOverrideCodespace, std::move(events));
}

operation_result_t engine::approve_next(const identity_t& caller,
                                        const uint64_t count) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kOverrideCodespace);
  }
  if (count == 0) {
    return make_failure(queue_error_code::zero_approval, kOverrideCodespace);
  }
  if (count > state_.tail - state_.cursor) {
    return make_failure(queue_error_code::unknown_entries, kOverrideCodespace);
  }
  auto next = state_;
  auto event = approve(next, count);
  apply(std::move(next));
  return make_success(kOverrideCodespace, {std::move(event)});
}

operation_result_t engine::set_cooldown(const identity_t& caller,
                                        const duration_seconds_t cooldown) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kConfigCodespace);
  }
  auto next = state_;
  next.cooldown = cooldown;
  apply(std::move(next));
  spdlog::info("Cooldown set to {}s", cooldown);
  return make_success(
      kConfigCodespace,
      {make_event(kCooldownSetEvent,
                  {make_attribute("cooldown", std::to_string(cooldown))})});
}

operation_result_t engine::set_expiration(const identity_t& caller,
                                          const duration_seconds_t expiration) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kConfigCodespace);
  }
  if (expiration != 0 && expiration < kMinimumExpiration) {
    return make_failure(queue_error_code::invalid_expiration, kConfigCodespace,
                        fmt::format("requested {}s", expiration));
  }
  auto next = state_;
  next.expiration = expiration;
  apply(std::move(next));
  spdlog::info("Expiration set to {}s", expiration);
  return make_success(
      kConfigCodespace,
      {make_event(kExpirationSetEvent,
                  {make_attribute("expiration", std::to_string(expiration))})});
}

operation_result_t engine::set_avatar(const identity_t& caller,
                                      const identity_t& avatar) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kConfigCodespace);
  }
  if (is_null_identity(avatar)) {
    return make_failure(queue_error_code::invalid_avatar, kConfigCodespace);
  }
  auto next = state_;
  auto previous = next.avatar;
  next.avatar = avatar;
  apply(std::move(next));
  spdlog::info("Avatar changed to {}", to_hex(avatar));
  return make_success(
      kConfigCodespace,
      {make_event(kAvatarSetEvent,
                  {make_attribute("previous", to_hex(previous)),
                   make_attribute("avatar", to_hex(avatar), true)})});
}

operation_result_t engine::set_target(const identity_t& caller,
                                      const identity_t& target) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kConfigCodespace);
  }
  if (is_null_identity(target)) {
    return make_failure(queue_error_code::invalid_target, kConfigCodespace);
  }
  auto next = state_;
  auto previous = next.target;
  next.target = target;
  apply(std::move(next));
  spdlog::info("Target changed to {}", to_hex(target));
  return make_success(
      kConfigCodespace,
      {make_event(kTargetSetEvent,
                  {make_attribute("previous", to_hex(previous)),
                   make_attribute("target", to_hex(target), true)})});
}

operation_result_t engine::transfer_administrator(
    const identity_t& caller,
    const identity_t& administrator) {
  if (!is_administrator(caller)) {
    return make_failure(queue_error_code::not_authorized, kConfigCodespace);
  }
  if (is_null_identity(administrator)) {
    return make_failure(queue_error_code::invalid_identity, kConfigCodespace);
  }
  auto next = state_;
  auto previous = next.administrator;
  next.administrator = administrator;
  apply(std::move(next));
  spdlog::info("Administrator transferred from {} to {}", to_hex(previous),
               to_hex(administrator));
  return make_success(
      kConfigCodespace,
      {make_event(kAdministratorTransferredEvent,
                  {make_attribute("previous", to_hex(previous), true),
                   make_attribute("administrator", to_hex(administrator),
                                  true)})});
}

uint64_t engine::cursor() const {
  return state_.cursor;
}

uint64_t engine::tail() const {
  return state_.tail;
}

uint64_t engine::approved_count() const {
  return state_.approved;
}

uint64_t engine::salt_counter() const {
  return state_.salt;
}

duration_seconds_t engine::cooldown() const {
  return state_.cooldown;
}

duration_seconds_t engine::expiration() const {
  return state_.expiration;
}

const identity_t& engine::administrator() const {
  return state_.administrator;
}

const identity_t& engine::avatar() const {
  return state_.avatar;
}

const identity_t& engine::target() const {
  return state_.target;
}

hash32_t engine::commitment_at(const uint64_t slot) const {
  if (slot >= state_.tail) {
    return make_zero_hash();
  }
  auto entry = storage_.load_entry(slot);
  return entry.has_value() ? entry->commitment : make_zero_hash();
}

timestamp_seconds_t engine::created_at_of(const uint64_t slot) const {
  if (slot >= state_.tail) {
    return 0;
  }
  auto entry = storage_.load_entry(slot);
  return entry.has_value() ? entry->created_at : timestamp_seconds_t{0};
}

const queue_state_t& engine::state() const {
  return state_;
}

}  // namespace vigil::execution
