#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/wallet_event.hpp>

#include <functional>

// Schema type: wallet event record.
// Wallet workflow: journal entry pairing an emitted event with its dense,
// emission-ordered id.
namespace quorum::schema {

template <uint16_t Version>
struct wallet_event_record;

template <>
struct wallet_event_record<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  wallet_event_t event;

  bool operator==(const wallet_event_record<1>&) const = default;
};

using wallet_event_record_t = wallet_event_record<1>;

using event_observer_t = std::function<void(const wallet_event_record_t&)>;

}  // namespace quorum::schema
