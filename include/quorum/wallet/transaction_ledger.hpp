#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/transaction_state.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace quorum::wallet {

/// Append-only sequence of proposed transfers and their approval sets.
///
/// Pure bookkeeping: ids are dense and assigned from 0, approvals are
/// membership-only. Authorization and state machine ordering belong to the
/// engine; the ledger only refuses to touch an executed record.
class transaction_ledger final {
 public:
  /// Append a new unapproved, unexecuted transaction and return its id.
  quorum::schema::transaction_id_t append(
      const quorum::schema::address_t& recipient,
      const quorum::schema::amount_t& value);

  /// Re-insert a persisted record; ids must arrive densely in order.
  void restore(const quorum::schema::transaction_state_t& state);
  /// Re-insert a persisted approval membership row.
  void restore_approval(quorum::schema::transaction_id_t id,
                        const quorum::schema::address_t& approver);

  bool contains(quorum::schema::transaction_id_t id) const;
  uint64_t size() const;

  /// Record at id. Callers check `contains` first.
  const quorum::schema::transaction_state_t& at(
      quorum::schema::transaction_id_t id) const;
  std::optional<quorum::schema::transaction_state_t> find(
      quorum::schema::transaction_id_t id) const;

  bool has_approved(quorum::schema::transaction_id_t id,
                    const quorum::schema::address_t& approver) const;

  /// Add approver to the set and return the new approval count.
  uint32_t record_approval(quorum::schema::transaction_id_t id,
                           const quorum::schema::address_t& approver);

  void mark_executed(quorum::schema::transaction_id_t id);
  /// Undo a tentative `mark_executed` after a failed value release.
  void clear_executed(quorum::schema::transaction_id_t id);

  /// Approvers of id in ascending address order.
  std::vector<quorum::schema::address_t> approvers(
      quorum::schema::transaction_id_t id) const;

 private:
  struct entry final {
    quorum::schema::transaction_state_t state;
    quorum::schema::address_set_t approvals;
  };

  entry& mutable_entry(quorum::schema::transaction_id_t id);

  std::vector<entry> entries_;
};

}  // namespace quorum::wallet
