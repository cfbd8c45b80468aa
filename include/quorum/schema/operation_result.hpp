#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/wallet_error.hpp>
#include <quorum/schema/wallet_event_record.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Wallet workflow: outcome of one propose/approve/execute/deposit call. `code`
// is 0 on success, otherwise the numeric wallet_error_code of `error`.
namespace quorum::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<wallet_error_t> error;
  std::optional<transaction_id_t> transaction_id;
  std::vector<wallet_event_record_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace quorum::schema
