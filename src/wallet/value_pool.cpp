#include <quorum/wallet/value_pool.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace quorum::schema;

namespace quorum::wallet {

amount_t value_pool<in_memory_pool_tag>::balance() const {
  return pool_balance_;
}

amount_t value_pool<in_memory_pool_tag>::balance_of(
    const address_t& account) const {
  auto found = accounts_.find(account);
  if (found == std::end(accounts_)) {
    return amount_t{0};
  }
  return found->second;
}

void value_pool<in_memory_pool_tag>::credit(const address_t& sender,
                                            const amount_t& amount) {
  pool_balance_ += amount;
  spdlog::debug("Pool credited {} by {}; balance {}", amount.str(),
                to_hex(sender), pool_balance_.str());
}

bool value_pool<in_memory_pool_tag>::release(const address_t& recipient,
                                             const amount_t& amount) {
  if (amount > pool_balance_) {
    spdlog::warn("Release of {} to {} refused: pool holds {}", amount.str(),
                 to_hex(recipient), pool_balance_.str());
    return false;
  }

  // Copy so a hook that clears itself does not destroy the running target.
  auto hook = receive_hook_t{};
  if (auto found = receive_hooks_.find(recipient);
      found != std::end(receive_hooks_)) {
    hook = found->second;
  }
  if (hook && !hook(recipient, amount)) {
    spdlog::warn("Recipient {} refused receipt of {}", to_hex(recipient),
                 amount.str());
    return false;
  }

  // The hook ran foreign code; the pool may no longer cover the release.
  if (amount > pool_balance_) {
    spdlog::warn("Release of {} to {} refused after receipt hook: pool holds {}",
                 amount.str(), to_hex(recipient), pool_balance_.str());
    return false;
  }

  pool_balance_ -= amount;
  accounts_[recipient] += amount;
  spdlog::debug("Released {} to {}; pool balance {}", amount.str(),
                to_hex(recipient), pool_balance_.str());
  return true;
}

void value_pool<in_memory_pool_tag>::set_receive_hook(
    const address_t& recipient,
    receive_hook_t hook) {
  receive_hooks_[recipient] = std::move(hook);
}

void value_pool<in_memory_pool_tag>::clear_receive_hook(
    const address_t& recipient) {
  receive_hooks_.erase(recipient);
}

}  // namespace quorum::wallet
