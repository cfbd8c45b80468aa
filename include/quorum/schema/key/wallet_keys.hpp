#pragma once

#include <quorum/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: wallet keys.
// Wallet workflow: canonical key prefixes and key codecs for the persisted
// wallet configuration, transaction ledger, approvals and event journal.
namespace quorum::schema::key {

inline constexpr std::string_view kConfigKeyPrefix{"SYS|STATE|CONFIG|"};
inline constexpr std::string_view kTransactionKeyPrefix{"SYS|STATE|TX|"};
inline constexpr std::string_view kApprovalKeyPrefix{"SYS|STATE|APPROVAL|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

/// Keyspaces folded into the wallet state root, in hashing order.
inline constexpr std::array<std::string_view, 4> kStateKeyspaces{
    kConfigKeyPrefix, kTransactionKeyPrefix, kApprovalKeyPrefix,
    kEventSeqKeyPrefix};

template <typename Encoder, typename T>
quorum::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
quorum::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
quorum::schema::bytes_t make_config_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kConfigKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
quorum::schema::bytes_t make_transaction_key(
    Encoder& encoder,
    const quorum::schema::transaction_id_t transaction_id) {
  return make_prefixed_key(encoder, kTransactionKeyPrefix, transaction_id);
}

template <typename Encoder>
quorum::schema::bytes_t make_approval_key(
    Encoder& encoder,
    const quorum::schema::transaction_id_t transaction_id,
    const quorum::schema::address_t& approver) {
  return make_prefixed_key(encoder, kApprovalKeyPrefix,
                           std::tuple{transaction_id, approver});
}

template <typename Encoder>
quorum::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
quorum::schema::bytes_t make_event_key(
    Encoder& encoder,
    const quorum::schema::event_id_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
std::optional<quorum::schema::event_id_t> parse_event_key(
    Encoder& encoder,
    const quorum::schema::bytes_view_t& key) {
  auto decoded =
      encoder.template try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kEventPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace quorum::schema::key
