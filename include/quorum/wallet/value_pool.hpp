#pragma once

#include <quorum/schema/primitives.hpp>

#include <functional>
#include <map>

namespace quorum::wallet {

/// Value-transfer substrate holding the pooled balance.
///
/// Backends are selected at build time by tag. The engine is the only
/// caller and serializes every access, so backends need no locking of their
/// own.
template <typename Library>
struct value_pool {
  /// Balance currently held by the pool.
  quorum::schema::amount_t balance() const;

  /// Balance credited to an external account by successful releases.
  quorum::schema::amount_t balance_of(
      const quorum::schema::address_t& account) const;

  /// Receive value into the pool.
  void credit(const quorum::schema::address_t& sender,
              const quorum::schema::amount_t& amount);

  /// Move value from the pool to recipient. Returns false, with nothing
  /// moved, when the pool is short or the recipient refuses receipt.
  bool release(const quorum::schema::address_t& recipient,
               const quorum::schema::amount_t& amount);
};

struct in_memory_pool_tag {};

/// Hook run when value is about to be received by an account. Returning
/// false refuses receipt. The hook may call back into the wallet.
using receive_hook_t =
    std::function<bool(const quorum::schema::address_t& recipient,
                       const quorum::schema::amount_t& amount)>;

template <>
struct value_pool<in_memory_pool_tag> final {
  quorum::schema::amount_t balance() const;
  quorum::schema::amount_t balance_of(
      const quorum::schema::address_t& account) const;
  void credit(const quorum::schema::address_t& sender,
              const quorum::schema::amount_t& amount);
  bool release(const quorum::schema::address_t& recipient,
               const quorum::schema::amount_t& amount);

  /// Install the receive hook that decides whether recipient accepts value.
  void set_receive_hook(const quorum::schema::address_t& recipient,
                        receive_hook_t hook);
  void clear_receive_hook(const quorum::schema::address_t& recipient);

 private:
  quorum::schema::amount_t pool_balance_{};
  std::map<quorum::schema::address_t, quorum::schema::amount_t> accounts_;
  std::map<quorum::schema::address_t, receive_hook_t> receive_hooks_;
};

}  // namespace quorum::wallet
