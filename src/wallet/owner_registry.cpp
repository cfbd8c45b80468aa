#include <quorum/schema/wallet_error.hpp>
#include <quorum/wallet/owner_registry.hpp>

#include <spdlog/spdlog.h>

using namespace quorum::schema;

namespace quorum::wallet {

owner_registry::owner_registry(const wallet_config_t& config) {
  if (config.owners.empty()) {
    throw wallet_exception{make_no_owners_error()};
  }

  auto owner_count = static_cast<uint64_t>(config.owners.size());
  if (config.required_approvals == 0 ||
      config.required_approvals > owner_count) {
    throw wallet_exception{make_invalid_required_approvals_error(
        config.required_approvals, owner_count)};
  }

  owners_.reserve(config.owners.size());
  authorized_.reserve(config.owners.size());
  for (const auto& owner : config.owners) {
    if (is_zero_address(owner)) {
      throw wallet_exception{make_zero_address_owner_error()};
    }
    if (!authorized_.insert(owner).second) {
      throw wallet_exception{make_owner_already_exists_error(owner)};
    }
    owners_.push_back(owner);
  }
  required_approvals_ = config.required_approvals;

  spdlog::debug("Owner registry accepted {} owner(s) with quorum {}",
                owners_.size(), required_approvals_);
}

bool owner_registry::is_owner(const address_t& principal) const {
  return authorized_.contains(principal);
}

const std::vector<address_t>& owner_registry::owners() const {
  return owners_;
}

uint32_t owner_registry::required_approvals() const {
  return required_approvals_;
}

wallet_config_t owner_registry::config() const {
  return wallet_config_t{.owners = owners_,
                         .required_approvals = required_approvals_};
}

}  // namespace quorum::wallet
