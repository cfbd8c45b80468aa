#pragma once

#include <quorum/schema/primitives.hpp>

// Schema type: transaction state.
// Wallet workflow: one proposed outgoing transfer with its approval tally and
// execution flag. Never deleted; frozen once executed.
namespace quorum::schema {

template <uint16_t Version>
struct transaction_state;

template <>
struct transaction_state<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  address_t recipient{};
  amount_t value{};
  uint32_t approval_count{};
  bool executed{};

  bool operator==(const transaction_state<1>&) const = default;
};

using transaction_state_t = transaction_state<1>;

}  // namespace quorum::schema
