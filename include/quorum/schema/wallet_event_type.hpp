#pragma once

#include <quorum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: wallet event type.
// Wallet workflow: names the notification kinds emitted for off-system
// observers.
namespace quorum::schema {

enum class wallet_event_type_t : uint8_t {
  owner_added = 0,
  deposit = 1,
  proposed_transaction = 2,
  approved_transaction = 3,
  already_approved_transaction = 4,
  transaction_executed = 5
};

inline constexpr auto kWalletEventTypeMappings = std::array{
    std::pair<std::string_view, wallet_event_type_t>{
        "OwnerAdded", wallet_event_type_t::owner_added},
    std::pair<std::string_view, wallet_event_type_t>{
        "Deposit", wallet_event_type_t::deposit},
    std::pair<std::string_view, wallet_event_type_t>{
        "ProposedTransaction", wallet_event_type_t::proposed_transaction},
    std::pair<std::string_view, wallet_event_type_t>{
        "ApprovedTransaction", wallet_event_type_t::approved_transaction},
    std::pair<std::string_view, wallet_event_type_t>{
        "AlreadyApprovedTransaction",
        wallet_event_type_t::already_approved_transaction},
    std::pair<std::string_view, wallet_event_type_t>{
        "TransactionExecuted", wallet_event_type_t::transaction_executed}};

template <>
inline std::optional<wallet_event_type_t> try_from_string<wallet_event_type_t>(
    const std::string_view value) {
  return from_string(value, kWalletEventTypeMappings);
}

inline constexpr std::string_view to_string(const wallet_event_type_t value) {
  return to_string(value, kWalletEventTypeMappings).value_or("unknown");
}

}  // namespace quorum::schema
