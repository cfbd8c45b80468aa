#pragma once

#include <quorum/schema/primitives.hpp>

#include <vector>

// Schema type: wallet config.
// Wallet workflow: construction input of the approval gate; the ordered owner
// list and the quorum threshold, persisted so a reopened wallet can be matched
// against its original configuration.
namespace quorum::schema {

template <uint16_t Version>
struct wallet_config;

template <>
struct wallet_config<1> final {
  uint16_t version{1};
  std::vector<address_t> owners;
  uint32_t required_approvals{};

  bool operator==(const wallet_config<1>&) const = default;
};

using wallet_config_t = wallet_config<1>;

}  // namespace quorum::schema
