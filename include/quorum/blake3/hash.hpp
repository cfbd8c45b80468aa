#pragma once
#include <quorum/schema/primitives.hpp>
#include <vector>

namespace quorum::blake3 {

/// Hash a sequence of byte strings as one stream, each preceded by its
/// little-endian 64-bit length so adjacent parts cannot alias.
quorum::schema::hash32_t hash_parts(
    const std::vector<quorum::schema::bytes_t>& parts);

}  // namespace quorum::blake3
