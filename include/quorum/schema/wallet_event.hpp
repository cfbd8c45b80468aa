#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/wallet_event_type.hpp>

#include <variant>

// Schema type: wallet event.
// Wallet workflow: notification payloads, one per state transition, carrying
// the fields an observer needs without querying the wallet back.
namespace quorum::schema {

template <uint16_t Version>
struct owner_added;

template <>
struct owner_added<1> final {
  uint16_t version{1};
  address_t owner{};

  bool operator==(const owner_added<1>&) const = default;
};

using owner_added_t = owner_added<1>;

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  address_t sender{};
  amount_t amount{};

  bool operator==(const deposit<1>&) const = default;
};

using deposit_t = deposit<1>;

template <uint16_t Version>
struct proposed_transaction;

template <>
struct proposed_transaction<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  address_t proposer{};
  address_t recipient{};
  amount_t value{};

  bool operator==(const proposed_transaction<1>&) const = default;
};

using proposed_transaction_t = proposed_transaction<1>;

template <uint16_t Version>
struct approved_transaction;

template <>
struct approved_transaction<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  address_t approver{};

  bool operator==(const approved_transaction<1>&) const = default;
};

using approved_transaction_t = approved_transaction<1>;

template <uint16_t Version>
struct already_approved_transaction;

template <>
struct already_approved_transaction<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  address_t approver{};

  bool operator==(const already_approved_transaction<1>&) const = default;
};

using already_approved_transaction_t = already_approved_transaction<1>;

template <uint16_t Version>
struct transaction_executed;

template <>
struct transaction_executed<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  address_t executor{};

  bool operator==(const transaction_executed<1>&) const = default;
};

using transaction_executed_t = transaction_executed<1>;

using wallet_event_t = std::variant<owner_added_t,
                                    deposit_t,
                                    proposed_transaction_t,
                                    approved_transaction_t,
                                    already_approved_transaction_t,
                                    transaction_executed_t>;

inline wallet_event_type_t event_type(const wallet_event_t& event) {
  return std::visit(
      overloaded{[](const owner_added_t&) {
                   return wallet_event_type_t::owner_added;
                 },
                 [](const deposit_t&) { return wallet_event_type_t::deposit; },
                 [](const proposed_transaction_t&) {
                   return wallet_event_type_t::proposed_transaction;
                 },
                 [](const approved_transaction_t&) {
                   return wallet_event_type_t::approved_transaction;
                 },
                 [](const already_approved_transaction_t&) {
                   return wallet_event_type_t::already_approved_transaction;
                 },
                 [](const transaction_executed_t&) {
                   return wallet_event_type_t::transaction_executed;
                 }},
      event);
}

}  // namespace quorum::schema
