#pragma once

#include <quorum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: wallet error code.
// Wallet workflow: stable numeric failure taxonomy shared by construction,
// authorization, reference, state-conflict and transfer failures.
namespace quorum::schema {

enum class wallet_error_code : uint32_t {
  no_owners = 1,
  invalid_required_approvals = 2,
  zero_address_owner = 3,
  owner_already_exists = 4,
  configuration_mismatch = 5,
  not_owner = 10,
  zero_address_recipient = 11,
  invalid_transaction_nonce = 12,
  transaction_already_executed = 13,
  not_enough_approvals = 14,
  transfer_failed = 15,
  reentrant_call = 16,
};

inline constexpr auto kWalletErrorCodeMappings = std::array{
    std::pair<std::string_view, wallet_error_code>{
        "no_owners", wallet_error_code::no_owners},
    std::pair<std::string_view, wallet_error_code>{
        "invalid_required_approvals",
        wallet_error_code::invalid_required_approvals},
    std::pair<std::string_view, wallet_error_code>{
        "zero_address_owner", wallet_error_code::zero_address_owner},
    std::pair<std::string_view, wallet_error_code>{
        "owner_already_exists", wallet_error_code::owner_already_exists},
    std::pair<std::string_view, wallet_error_code>{
        "configuration_mismatch", wallet_error_code::configuration_mismatch},
    std::pair<std::string_view, wallet_error_code>{
        "not_owner", wallet_error_code::not_owner},
    std::pair<std::string_view, wallet_error_code>{
        "zero_address_recipient", wallet_error_code::zero_address_recipient},
    std::pair<std::string_view, wallet_error_code>{
        "invalid_transaction_nonce",
        wallet_error_code::invalid_transaction_nonce},
    std::pair<std::string_view, wallet_error_code>{
        "transaction_already_executed",
        wallet_error_code::transaction_already_executed},
    std::pair<std::string_view, wallet_error_code>{
        "not_enough_approvals", wallet_error_code::not_enough_approvals},
    std::pair<std::string_view, wallet_error_code>{
        "transfer_failed", wallet_error_code::transfer_failed},
    std::pair<std::string_view, wallet_error_code>{
        "reentrant_call", wallet_error_code::reentrant_call}};

template <>
inline std::optional<wallet_error_code> try_from_string<wallet_error_code>(
    const std::string_view value) {
  return from_string(value, kWalletErrorCodeMappings);
}

inline constexpr std::string_view to_string(const wallet_error_code value) {
  return to_string(value, kWalletErrorCodeMappings).value_or("unknown");
}

}  // namespace quorum::schema
