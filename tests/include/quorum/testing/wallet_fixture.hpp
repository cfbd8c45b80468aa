#pragma once

#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/wallet_config.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <quorum/testing/common.hpp>
#include <quorum/wallet/engine.hpp>
#include <quorum/wallet/value_pool.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quorum::testing {

using scale_encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    quorum::storage::storage<quorum::storage::rocksdb_storage_tag>;
using in_memory_pool_t =
    quorum::wallet::value_pool<quorum::wallet::in_memory_pool_tag>;

/// Owners seeded 10, 40, 70, ... so their addresses never overlap.
inline quorum::schema::wallet_config_t make_config(
    const std::size_t owner_count,
    const uint32_t required_approvals) {
  auto config = quorum::schema::wallet_config_t{};
  for (std::size_t i = 0; i < owner_count; ++i) {
    config.owners.push_back(make_address(static_cast<uint8_t>(10 + (30 * i))));
  }
  config.required_approvals = required_approvals;
  return config;
}

/// Wallet engine over a throwaway RocksDB directory and an in-memory pool.
class wallet_fixture final {
 public:
  explicit wallet_fixture(const std::string_view db_prefix,
                          quorum::schema::wallet_config_t config =
                              make_config(3, 2))
      : db_path_{make_db_path(db_prefix)},
        config_{std::move(config)},
        encoder_{},
        storage_{quorum::storage::make_storage<
            quorum::storage::rocksdb_storage_tag>(db_path_)},
        pool_{},
        engine_{std::make_unique<quorum::wallet::engine>(encoder_, storage_,
                                                         pool_, config_)} {}

  wallet_fixture(const wallet_fixture&) = delete;
  wallet_fixture& operator=(const wallet_fixture&) = delete;
  wallet_fixture(wallet_fixture&&) = delete;
  wallet_fixture& operator=(wallet_fixture&&) = delete;

  ~wallet_fixture() {
    engine_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  const quorum::schema::wallet_config_t& config() const { return config_; }

  quorum::schema::address_t owner(const std::size_t index) const {
    return config_.owners.at(index);
  }

  scale_encoder_t& encoder() { return encoder_; }
  rocksdb_storage_t& storage() { return storage_; }
  in_memory_pool_t& pool() { return pool_; }
  quorum::wallet::engine& engine() { return *engine_; }

  /// Close the database and open it again with config. Throws whatever the
  /// engine constructor throws, leaving the fixture without an engine.
  void reopen(const quorum::schema::wallet_config_t& config) {
    engine_.reset();
    storage_.database.reset();
    storage_ = quorum::storage::make_storage<
        quorum::storage::rocksdb_storage_tag>(db_path_);
    engine_ = std::make_unique<quorum::wallet::engine>(encoder_, storage_,
                                                       pool_, config);
  }

  void reopen() { reopen(config_); }

 private:
  std::string db_path_;
  quorum::schema::wallet_config_t config_;
  scale_encoder_t encoder_;
  rocksdb_storage_t storage_;
  in_memory_pool_t pool_;
  std::unique_ptr<quorum::wallet::engine> engine_;
};

}  // namespace quorum::testing
