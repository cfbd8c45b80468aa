#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <quorum/blake3/hash.hpp>
#include <quorum/common/critical.hpp>
#include <quorum/schema/approval_state.hpp>
#include <quorum/schema/key/wallet_keys.hpp>
#include <quorum/schema/wallet_error.hpp>
#include <quorum/wallet/engine.hpp>
#include <string>
#include <utility>

using namespace quorum::schema;

namespace {

inline constexpr auto kProposeCodespace = std::string_view{"quorum.propose"};
inline constexpr auto kApproveCodespace = std::string_view{"quorum.approve"};
inline constexpr auto kExecuteCodespace = std::string_view{"quorum.execute"};
inline constexpr auto kDepositCodespace = std::string_view{"quorum.deposit"};

/// Holds the in-flight flag for the full span of an execute call.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& in_flight) : in_flight_{in_flight} {
    in_flight_ = true;
  }
  ~reentrancy_guard() { in_flight_ = false; }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;

 private:
  bool& in_flight_;
};

operation_result_t accept(const std::string_view codespace) {
  auto result = operation_result_t{};
  result.code = 0;
  result.codespace = std::string{codespace};
  return result;
}

operation_result_t reject(const std::string_view codespace,
                          wallet_error_t error) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(error.code);
  result.log = describe(error);
  result.codespace = std::string{codespace};
  result.error = std::move(error);
  spdlog::warn("{} rejected: {}", codespace, result.log);
  return result;
}

}  // namespace

namespace quorum::wallet {

engine::engine(
    quorum::schema::encoding::encoder<
        quorum::schema::encoding::scale_encoder_tag>& encoder,
    quorum::storage::storage<quorum::storage::rocksdb_storage_tag>& storage,
    value_pool<in_memory_pool_tag>& pool,
    const wallet_config_t& config)
    : encoder_{encoder}, storage_{storage}, pool_{pool}, registry_{config} {
  auto lock = std::scoped_lock{mutex_};
  auto config_key = schema::key::make_config_key(encoder_);
  auto persisted =
      storage_.get<wallet_config_t>(encoder_, make_bytes_view(config_key));
  if (!persisted) {
    provision();
    return;
  }

  if (*persisted != registry_.config()) {
    spdlog::error(
        "Persisted wallet has {} owner(s) with quorum {}; refusing to open it "
        "with {} owner(s) and quorum {}",
        persisted->owners.size(), persisted->required_approvals,
        config.owners.size(), config.required_approvals);
    throw wallet_exception{make_configuration_mismatch_error()};
  }
  load_persisted_state();
  spdlog::info(
      "Wallet reopened with {} owner(s), quorum {}, {} transaction(s) and {} "
      "event(s)",
      registry_.owners().size(), registry_.required_approvals(),
      ledger_.size(), next_event_id_);
}

operation_result_t engine::propose(const address_t& caller,
                                   const address_t& recipient,
                                   const amount_t& value) {
  auto lock = std::scoped_lock{mutex_};
  if (in_flight_) {
    return reject(kProposeCodespace, make_reentrant_call_error(caller));
  }
  if (!registry_.is_owner(caller)) {
    return reject(kProposeCodespace, make_not_owner_error(caller));
  }
  if (is_zero_address(recipient)) {
    return reject(kProposeCodespace, make_zero_address_recipient_error());
  }

  auto id = ledger_.append(recipient, value);
  auto writes = write_set_t{};
  stage_transaction(id, writes);

  auto result = accept(kProposeCodespace);
  result.transaction_id = id;
  result.events.push_back(
      append_event(proposed_transaction_t{.transaction_id = id,
                                          .proposer = caller,
                                          .recipient = recipient,
                                          .value = value},
                   writes));
  commit(writes);

  spdlog::info("Transaction {} proposed by {}: {} to {}", id, to_hex(caller),
               value.str(), to_hex(recipient));
  publish(result.events);
  return result;
}

operation_result_t engine::approve(const address_t& caller,
                                   const transaction_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  if (in_flight_) {
    return reject(kApproveCodespace, make_reentrant_call_error(caller));
  }
  if (!registry_.is_owner(caller)) {
    return reject(kApproveCodespace, make_not_owner_error(caller));
  }
  if (!ledger_.contains(id)) {
    return reject(kApproveCodespace, make_invalid_transaction_nonce_error(id));
  }

  auto writes = write_set_t{};
  auto result = accept(kApproveCodespace);
  result.transaction_id = id;

  // Re-approval short-circuits before the executed check, so an owner who
  // already approved an executed transaction still gets the notification.
  if (ledger_.has_approved(id, caller)) {
    result.events.push_back(append_event(
        already_approved_transaction_t{.transaction_id = id,
                                       .approver = caller},
        writes));
    commit(writes);
    spdlog::debug("Transaction {} already approved by {}", id,
                  to_hex(caller));
    publish(result.events);
    return result;
  }
  if (ledger_.at(id).executed) {
    return reject(kApproveCodespace,
                  make_transaction_already_executed_error(id));
  }

  auto approvals = ledger_.record_approval(id, caller);
  stage_transaction(id, writes);
  stage_approval(id, caller, writes);
  result.events.push_back(append_event(
      approved_transaction_t{.transaction_id = id, .approver = caller},
      writes));
  commit(writes);

  spdlog::info("Transaction {} approved by {} ({}/{})", id, to_hex(caller),
               approvals, registry_.required_approvals());
  publish(result.events);
  return result;
}

operation_result_t engine::execute(const address_t& caller,
                                   const transaction_id_t id) {
  auto lock = std::scoped_lock{mutex_};
  if (in_flight_) {
    return reject(kExecuteCodespace, make_reentrant_call_error(caller));
  }

  auto result = operation_result_t{};
  {
    auto guard = reentrancy_guard{in_flight_};
    result = execute_guarded(caller, id);
  }
  publish(result.events);
  return result;
}

operation_result_t engine::execute_guarded(const address_t& caller,
                                           const transaction_id_t id) {
  if (!registry_.is_owner(caller)) {
    return reject(kExecuteCodespace, make_not_owner_error(caller));
  }
  if (!ledger_.contains(id)) {
    return reject(kExecuteCodespace, make_invalid_transaction_nonce_error(id));
  }

  const auto pending = ledger_.at(id);
  if (pending.executed) {
    return reject(kExecuteCodespace,
                  make_transaction_already_executed_error(id));
  }
  if (pending.approval_count < registry_.required_approvals()) {
    return reject(kExecuteCodespace,
                  make_not_enough_approvals_error(
                      id, pending.approval_count,
                      registry_.required_approvals()));
  }

  // Commit the executed mark before any value leaves the pool.
  ledger_.mark_executed(id);
  auto released = false;
  try {
    released = pool_.release(pending.recipient, pending.value);
  } catch (const std::exception& ex) {
    spdlog::error("Release for transaction {} threw: {}", id, ex.what());
  } catch (...) {
    spdlog::error("Release for transaction {} threw a non-standard exception",
                  id);
  }
  if (!released) {
    ledger_.clear_executed(id);
    return reject(kExecuteCodespace, make_transfer_failed_error(id));
  }

  auto writes = write_set_t{};
  stage_transaction(id, writes);
  auto result = accept(kExecuteCodespace);
  result.transaction_id = id;
  result.events.push_back(append_event(
      transaction_executed_t{.transaction_id = id, .executor = caller},
      writes));
  commit(writes);

  spdlog::info("Transaction {} executed by {}: released {} to {}", id,
               to_hex(caller), pending.value.str(),
               to_hex(pending.recipient));
  return result;
}

operation_result_t engine::deposit(const address_t& sender,
                                   const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (in_flight_) {
    return reject(kDepositCodespace, make_reentrant_call_error(sender));
  }

  pool_.credit(sender, amount);
  auto writes = write_set_t{};
  auto result = accept(kDepositCodespace);
  result.events.push_back(append_event(
      deposit_t{.sender = sender, .amount = amount}, writes));
  commit(writes);

  spdlog::info("Deposit of {} from {}", amount.str(), to_hex(sender));
  publish(result.events);
  return result;
}

bool engine::is_owner(const address_t& principal) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.is_owner(principal);
}

std::vector<address_t> engine::owners() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.owners();
}

uint32_t engine::required_approvals() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.required_approvals();
}

bool engine::has_approved(const transaction_id_t id,
                          const address_t& principal) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.has_approved(id, principal);
}

std::optional<transaction_state_t> engine::transaction(
    const transaction_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.find(id);
}

uint64_t engine::transaction_count() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.size();
}

amount_t engine::balance() const {
  auto lock = std::scoped_lock{mutex_};
  return pool_.balance();
}

std::vector<wallet_event_record_t> engine::events(const event_id_t from_id,
                                                  const event_id_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<wallet_event_record_t>{};
  if (next_event_id_ == 0 || from_id > to_id || from_id >= next_event_id_) {
    return records;
  }

  auto last = std::min(to_id, next_event_id_ - 1);
  records.reserve(static_cast<std::size_t>(last - from_id + 1));
  for (auto event_id = from_id; event_id <= last; ++event_id) {
    auto key = schema::key::make_event_key(encoder_, event_id);
    auto record =
        storage_.get<wallet_event_record_t>(encoder_, make_bytes_view(key));
    if (!record) {
      quorum::common::critical("event {} is missing from the journal",
                               event_id);
    }
    records.push_back(std::move(*record));
  }
  return records;
}

hash32_t engine::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  auto parts = std::vector<bytes_t>{};
  for (const auto keyspace : schema::key::kStateKeyspaces) {
    auto prefix = schema::key::make_prefix_key(encoder_, keyspace);
    for (auto& [key, value] :
         storage_.list_by_prefix(make_bytes_view(prefix))) {
      parts.push_back(std::move(key));
      parts.push_back(std::move(value));
    }
  }
  return quorum::blake3::hash_parts(parts);
}

void engine::set_event_observer(event_observer_t observer) {
  auto lock = std::scoped_lock{mutex_};
  event_observer_ = std::move(observer);
}

wallet_event_record_t engine::append_event(wallet_event_t event,
                                           write_set_t& writes) {
  auto record = wallet_event_record_t{.event_id = next_event_id_,
                                      .event = std::move(event)};
  ++next_event_id_;
  writes.emplace_back(schema::key::make_event_key(encoder_, record.event_id),
                      encoder_.encode(record));
  spdlog::debug("Event {} {}", record.event_id,
                to_string(event_type(record.event)));
  return record;
}

void engine::stage_transaction(const transaction_id_t id, write_set_t& writes) {
  writes.emplace_back(schema::key::make_transaction_key(encoder_, id),
                      encoder_.encode(ledger_.at(id)));
}

void engine::stage_approval(const transaction_id_t id,
                            const address_t& approver,
                            write_set_t& writes) {
  writes.emplace_back(
      schema::key::make_approval_key(encoder_, id, approver),
      encoder_.encode(
          approval_state_t{.transaction_id = id, .approver = approver}));
}

void engine::commit(write_set_t& writes) {
  writes.emplace_back(schema::key::make_event_sequence_key(encoder_),
                      encoder_.encode(next_event_id_));
  storage_.write_batch(writes);
}

void engine::publish(const std::vector<wallet_event_record_t>& events) const {
  // Copy so an observer that replaces itself keeps its own closure alive.
  auto observer = event_observer_;
  if (!observer) {
    return;
  }
  for (const auto& record : events) {
    observer(record);
  }
}

void engine::provision() {
  auto writes = write_set_t{};
  writes.emplace_back(schema::key::make_config_key(encoder_),
                      encoder_.encode(registry_.config()));
  for (const auto& owner : registry_.owners()) {
    append_event(owner_added_t{.owner = owner}, writes);
  }
  commit(writes);
  spdlog::info("Wallet provisioned with {} owner(s) and quorum {}",
               registry_.owners().size(), registry_.required_approvals());
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted wallet state");

  auto tx_prefix =
      schema::key::make_prefix_key(encoder_, schema::key::kTransactionKeyPrefix);
  auto transactions = std::vector<transaction_state_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(tx_prefix))) {
    transactions.push_back(
        encoder_.decode<transaction_state_t>(make_bytes_view(value)));
  }
  // Keys order by encoded id bytes, not numerically.
  std::ranges::sort(transactions, {}, &transaction_state_t::transaction_id);
  for (const auto& state : transactions) {
    ledger_.restore(state);
  }

  auto approval_prefix =
      schema::key::make_prefix_key(encoder_, schema::key::kApprovalKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(approval_prefix))) {
    auto approval = encoder_.decode<approval_state_t>(make_bytes_view(value));
    ledger_.restore_approval(approval.transaction_id, approval.approver);
  }
  for (const auto& state : transactions) {
    auto approvers = ledger_.approvers(state.transaction_id);
    if (approvers.size() != state.approval_count) {
      quorum::common::critical(
          "transaction {} records {} approval(s) but {} approval row(s)",
          state.transaction_id, state.approval_count, approvers.size());
    }
  }

  auto sequence_key = schema::key::make_event_sequence_key(encoder_);
  next_event_id_ = storage_.get<event_id_t>(encoder_,
                                            make_bytes_view(sequence_key))
                       .value_or(0);
}

}  // namespace quorum::wallet
