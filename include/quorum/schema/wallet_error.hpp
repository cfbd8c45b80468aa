#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/wallet_error_code.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// Schema type: wallet error.
// Wallet workflow: structured failure carrying the offending id, counts and
// principal so a caller can diagnose without re-querying state.
namespace quorum::schema {

template <uint16_t Version>
struct wallet_error;

template <>
struct wallet_error<1> final {
  uint16_t version{1};
  wallet_error_code code{};
  std::optional<transaction_id_t> transaction_id;
  std::optional<address_t> principal;
  std::optional<uint32_t> approval_count;
  std::optional<uint32_t> required_approvals;
  std::optional<uint64_t> owner_count;

  bool operator==(const wallet_error<1>&) const = default;
};

using wallet_error_t = wallet_error<1>;

wallet_error_t make_no_owners_error();
wallet_error_t make_invalid_required_approvals_error(
    uint32_t required_approvals,
    uint64_t owner_count);
wallet_error_t make_zero_address_owner_error();
wallet_error_t make_owner_already_exists_error(const address_t& owner);
wallet_error_t make_configuration_mismatch_error();
wallet_error_t make_not_owner_error(const address_t& caller);
wallet_error_t make_zero_address_recipient_error();
wallet_error_t make_invalid_transaction_nonce_error(transaction_id_t id);
wallet_error_t make_transaction_already_executed_error(transaction_id_t id);
wallet_error_t make_not_enough_approvals_error(transaction_id_t id,
                                               uint32_t approval_count,
                                               uint32_t required_approvals);
wallet_error_t make_transfer_failed_error(transaction_id_t id);
wallet_error_t make_reentrant_call_error(const address_t& caller);

/// Render an error with its structured fields, e.g.
/// `not_enough_approvals(transaction_id=0, approval_count=1, required=2)`.
std::string describe(const wallet_error_t& error);

/// Thrown when a wallet cannot be constructed; no partial instance exists.
class wallet_exception final : public std::runtime_error {
 public:
  explicit wallet_exception(wallet_error_t error);

  const wallet_error_t& error() const { return error_; }
  wallet_error_code code() const { return error_.code; }

 private:
  wallet_error_t error_;
};

}  // namespace quorum::schema
