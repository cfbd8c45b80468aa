#pragma once
#include <array>
#include <boost/container_hash/hash.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

namespace quorum::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
/// Principal identifier; the all-zero address is the null principal.
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using transaction_id_t = uint64_t;
using event_id_t = uint64_t;

using address_hash_t = boost::hash<address_t>;
using address_set_t = std::unordered_set<address_t, address_hash_t>;

bytes_view_t make_bytes_view(const bytes_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Parse a 40 digit hex address, with or without a `0x` prefix.
std::optional<address_t> try_make_address(std::string_view hex);
address_t make_zero_address();
bool is_zero_address(const address_t& address);
/// Lowercase `0x` prefixed rendering used in logs and error messages.
std::string to_hex(const address_t& address);

}  // namespace quorum::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
