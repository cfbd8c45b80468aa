#include <quorum/schema/wallet_error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <utility>
#include <vector>

namespace quorum::schema {

namespace {

wallet_error_t make_error(const wallet_error_code code) {
  return wallet_error_t{.code = code};
}

}  // namespace

wallet_error_t make_no_owners_error() {
  return make_error(wallet_error_code::no_owners);
}

wallet_error_t make_invalid_required_approvals_error(
    const uint32_t required_approvals,
    const uint64_t owner_count) {
  auto error = make_error(wallet_error_code::invalid_required_approvals);
  error.required_approvals = required_approvals;
  error.owner_count = owner_count;
  return error;
}

wallet_error_t make_zero_address_owner_error() {
  return make_error(wallet_error_code::zero_address_owner);
}

wallet_error_t make_owner_already_exists_error(const address_t& owner) {
  auto error = make_error(wallet_error_code::owner_already_exists);
  error.principal = owner;
  return error;
}

wallet_error_t make_configuration_mismatch_error() {
  return make_error(wallet_error_code::configuration_mismatch);
}

wallet_error_t make_not_owner_error(const address_t& caller) {
  auto error = make_error(wallet_error_code::not_owner);
  error.principal = caller;
  return error;
}

wallet_error_t make_zero_address_recipient_error() {
  return make_error(wallet_error_code::zero_address_recipient);
}

wallet_error_t make_invalid_transaction_nonce_error(const transaction_id_t id) {
  auto error = make_error(wallet_error_code::invalid_transaction_nonce);
  error.transaction_id = id;
  return error;
}

wallet_error_t make_transaction_already_executed_error(
    const transaction_id_t id) {
  auto error = make_error(wallet_error_code::transaction_already_executed);
  error.transaction_id = id;
  return error;
}

wallet_error_t make_not_enough_approvals_error(
    const transaction_id_t id,
    const uint32_t approval_count,
    const uint32_t required_approvals) {
  auto error = make_error(wallet_error_code::not_enough_approvals);
  error.transaction_id = id;
  error.approval_count = approval_count;
  error.required_approvals = required_approvals;
  return error;
}

wallet_error_t make_transfer_failed_error(const transaction_id_t id) {
  auto error = make_error(wallet_error_code::transfer_failed);
  error.transaction_id = id;
  return error;
}

wallet_error_t make_reentrant_call_error(const address_t& caller) {
  auto error = make_error(wallet_error_code::reentrant_call);
  error.principal = caller;
  return error;
}

std::string describe(const wallet_error_t& error) {
  auto fields = std::vector<std::string>{};
  if (error.transaction_id) {
    fields.push_back(fmt::format("transaction_id={}", *error.transaction_id));
  }
  if (error.principal) {
    fields.push_back(fmt::format("principal={}", to_hex(*error.principal)));
  }
  if (error.approval_count) {
    fields.push_back(fmt::format("approval_count={}", *error.approval_count));
  }
  if (error.required_approvals) {
    fields.push_back(fmt::format("required={}", *error.required_approvals));
  }
  if (error.owner_count) {
    fields.push_back(fmt::format("owner_count={}", *error.owner_count));
  }
  if (fields.empty()) {
    return std::string{to_string(error.code)};
  }
  return fmt::format("{}({})", to_string(error.code),
                     fmt::join(fields, ", "));
}

wallet_exception::wallet_exception(wallet_error_t error)
    : std::runtime_error{describe(error)}, error_{std::move(error)} {}

}  // namespace quorum::schema
