#include <blake3.h>
#include <quorum/blake3/hash.hpp>
#include <array>
#include <cstdint>

namespace quorum::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
  }

  quorum::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<quorum::schema::hash32_t>);
    auto output = quorum::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

quorum::schema::hash32_t hash_parts(
    const std::vector<quorum::schema::bytes_t>& parts) {
  auto h = hasher{};
  for (const auto& part : parts) {
    auto length = std::array<uint8_t, 8>{};
    auto size = static_cast<uint64_t>(part.size());
    for (std::size_t i = 0; i < length.size(); ++i) {
      length[i] = static_cast<uint8_t>((size >> (i * 8)) & 0xFFu);
    }
    h.update(length.data(), length.size());
    h.update(part.data(), part.size());
  }
  return h.finalize();
}

}  // namespace quorum::blake3
