#pragma once

#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/operation_result.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/transaction_state.hpp>
#include <quorum/schema/wallet_config.hpp>
#include <quorum/schema/wallet_event_record.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <quorum/wallet/owner_registry.hpp>
#include <quorum/wallet/transaction_ledger.hpp>
#include <quorum/wallet/value_pool.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace quorum::wallet {

/// n-of-m approval gate over a shared pool of value.
///
/// Owns the owner registry and the transaction ledger, enforces the
/// propose -> approve -> execute state machine, journals every committed
/// change to storage and notifies the installed observer of each event.
class engine final {
 public:
  /// Open the wallet held in `storage`, or provision it from `config` when
  /// storage is empty.
  ///
  /// Throws `quorum::schema::wallet_exception` when `config` is invalid or
  /// differs from the configuration already persisted in `storage`. A fresh
  /// wallet journals one OwnerAdded event per owner, in input order.
  explicit engine(
      quorum::schema::encoding::encoder<
          quorum::schema::encoding::scale_encoder_tag>& encoder,
      quorum::storage::storage<quorum::storage::rocksdb_storage_tag>& storage,
      value_pool<in_memory_pool_tag>& pool,
      const quorum::schema::wallet_config_t& config);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Record a new transfer proposal and return its id in `transaction_id`.
  ///
  /// The proposer is not counted as an approver. Value sufficiency is only
  /// checked at execution.
  quorum::schema::operation_result_t propose(
      const quorum::schema::address_t& caller,
      const quorum::schema::address_t& recipient,
      const quorum::schema::amount_t& value);

  /// Add caller's approval to transaction `id`.
  ///
  /// Checks run in this order: owner, existence, already approved (reported
  /// by an AlreadyApprovedTransaction event, not an error), executed.
  quorum::schema::operation_result_t approve(
      const quorum::schema::address_t& caller,
      quorum::schema::transaction_id_t id);

  /// Release the value of transaction `id` once quorum is met.
  ///
  /// The transaction is marked executed before the value is released and the
  /// mark is rolled back when the release fails. Nested mutating calls made
  /// while the release is in flight are rejected.
  quorum::schema::operation_result_t execute(
      const quorum::schema::address_t& caller,
      quorum::schema::transaction_id_t id);

  /// Receive value into the pool from any sender.
  quorum::schema::operation_result_t deposit(
      const quorum::schema::address_t& sender,
      const quorum::schema::amount_t& amount);

  bool is_owner(const quorum::schema::address_t& principal) const;
  std::vector<quorum::schema::address_t> owners() const;
  uint32_t required_approvals() const;

  /// False for unknown transaction ids.
  bool has_approved(quorum::schema::transaction_id_t id,
                    const quorum::schema::address_t& principal) const;
  std::optional<quorum::schema::transaction_state_t> transaction(
      quorum::schema::transaction_id_t id) const;
  uint64_t transaction_count() const;

  /// Current pool balance.
  quorum::schema::amount_t balance() const;

  /// Journaled events with ids in the inclusive range, clamped to the events
  /// emitted so far.
  std::vector<quorum::schema::wallet_event_record_t> events(
      quorum::schema::event_id_t from_id,
      quorum::schema::event_id_t to_id) const;

  /// BLAKE3 digest over every persisted state row.
  quorum::schema::hash32_t state_root() const;

  /// Install the observer notified, in event id order, after each operation
  /// commits. Observers may call back into the engine.
  void set_event_observer(quorum::schema::event_observer_t observer);

 private:
  using write_set_t = std::vector<quorum::storage::key_value_entry_t>;

  quorum::schema::operation_result_t execute_guarded(
      const quorum::schema::address_t& caller,
      quorum::schema::transaction_id_t id);

  /// Assign the next event id and stage the journal row.
  quorum::schema::wallet_event_record_t append_event(
      quorum::schema::wallet_event_t event,
      write_set_t& writes);
  void stage_transaction(quorum::schema::transaction_id_t id,
                         write_set_t& writes);
  void stage_approval(quorum::schema::transaction_id_t id,
                      const quorum::schema::address_t& approver,
                      write_set_t& writes);
  /// Stage the event sequence and write everything in one batch.
  void commit(write_set_t& writes);
  void publish(
      const std::vector<quorum::schema::wallet_event_record_t>& events) const;

  void provision();
  /// Load ledger, approvals and event sequence from storage at startup.
  void load_persisted_state();

  mutable std::recursive_mutex mutex_;
  quorum::schema::encoding::encoder<
      quorum::schema::encoding::scale_encoder_tag>& encoder_;
  quorum::storage::storage<quorum::storage::rocksdb_storage_tag>& storage_;
  value_pool<in_memory_pool_tag>& pool_;
  owner_registry registry_;
  transaction_ledger ledger_;
  quorum::schema::event_id_t next_event_id_{};
  bool in_flight_{false};
  quorum::schema::event_observer_t event_observer_;
};

}  // namespace quorum::wallet
