#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/wallet_config.hpp>

#include <cstdint>
#include <vector>

namespace quorum::wallet {

/// Immutable set of authorized principals plus the quorum threshold.
///
/// Established once from a wallet configuration and never mutated afterward.
/// Construction validates the whole input and throws
/// `quorum::schema::wallet_exception` on the first violation, checked in
/// this order: empty owner list, threshold outside `[1, owner count]`, then
/// per entry in input order a null principal or a principal already accepted.
class owner_registry final {
 public:
  explicit owner_registry(const quorum::schema::wallet_config_t& config);

  /// O(1) membership query.
  bool is_owner(const quorum::schema::address_t& principal) const;

  /// Owners in their original insertion order.
  const std::vector<quorum::schema::address_t>& owners() const;

  uint32_t required_approvals() const;

  /// The configuration this registry was built from.
  quorum::schema::wallet_config_t config() const;

 private:
  std::vector<quorum::schema::address_t> owners_;
  quorum::schema::address_set_t authorized_;
  uint32_t required_approvals_{};
};

}  // namespace quorum::wallet
