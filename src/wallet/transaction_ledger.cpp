#include <quorum/common/critical.hpp>
#include <quorum/wallet/transaction_ledger.hpp>

#include <algorithm>
#include <iterator>

using namespace quorum::schema;

namespace quorum::wallet {

transaction_id_t transaction_ledger::append(const address_t& recipient,
                                            const amount_t& value) {
  auto id = static_cast<transaction_id_t>(entries_.size());
  entries_.push_back(entry{
      .state = transaction_state_t{.transaction_id = id,
                                   .recipient = recipient,
                                   .value = value,
                                   .approval_count = 0,
                                   .executed = false},
      .approvals = {}});
  return id;
}

void transaction_ledger::restore(const transaction_state_t& state) {
  if (state.transaction_id != entries_.size()) {
    quorum::common::critical(
        "persisted ledger is not dense: expected transaction {} but found {}",
        entries_.size(), state.transaction_id);
  }
  entries_.push_back(entry{.state = state, .approvals = {}});
}

void transaction_ledger::restore_approval(const transaction_id_t id,
                                          const address_t& approver) {
  if (!contains(id)) {
    quorum::common::critical("approval row references unknown transaction {}",
                             id);
  }
  entries_[id].approvals.insert(approver);
}

bool transaction_ledger::contains(const transaction_id_t id) const {
  return id < entries_.size();
}

uint64_t transaction_ledger::size() const {
  return entries_.size();
}

const transaction_state_t& transaction_ledger::at(
    const transaction_id_t id) const {
  if (!contains(id)) {
    quorum::common::critical("transaction {} is out of range", id);
  }
  return entries_[id].state;
}

std::optional<transaction_state_t> transaction_ledger::find(
    const transaction_id_t id) const {
  if (!contains(id)) {
    return std::nullopt;
  }
  return entries_[id].state;
}

bool transaction_ledger::has_approved(const transaction_id_t id,
                                      const address_t& approver) const {
  if (!contains(id)) {
    return false;
  }
  return entries_[id].approvals.contains(approver);
}

uint32_t transaction_ledger::record_approval(const transaction_id_t id,
                                             const address_t& approver) {
  auto& target = mutable_entry(id);
  if (target.approvals.insert(approver).second) {
    ++target.state.approval_count;
  }
  return target.state.approval_count;
}

void transaction_ledger::mark_executed(const transaction_id_t id) {
  mutable_entry(id).state.executed = true;
}

void transaction_ledger::clear_executed(const transaction_id_t id) {
  if (!contains(id)) {
    quorum::common::critical("transaction {} is out of range", id);
  }
  entries_[id].state.executed = false;
}

std::vector<address_t> transaction_ledger::approvers(
    const transaction_id_t id) const {
  if (!contains(id)) {
    return {};
  }
  const auto& approvals = entries_[id].approvals;
  auto out = std::vector<address_t>{std::begin(approvals), std::end(approvals)};
  std::ranges::sort(out);
  return out;
}

transaction_ledger::entry& transaction_ledger::mutable_entry(
    const transaction_id_t id) {
  if (!contains(id)) {
    quorum::common::critical("transaction {} is out of range", id);
  }
  auto& target = entries_[id];
  if (target.state.executed) {
    quorum::common::critical("transaction {} is executed and frozen", id);
  }
  return target;
}

}  // namespace quorum::wallet
