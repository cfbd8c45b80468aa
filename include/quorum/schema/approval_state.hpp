#pragma once

#include <quorum/schema/primitives.hpp>

// Schema type: approval state.
// Wallet workflow: approval ledger row recording that an owner approved a
// transaction. Membership only; re-approval never creates a second row.
namespace quorum::schema {

template <uint16_t Version>
struct approval_state;

template <>
struct approval_state<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  address_t approver{};
};

using approval_state_t = approval_state<1>;

}  // namespace quorum::schema
