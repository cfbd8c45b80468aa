#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <quorum/storage/storage.hpp>
#include <quorum/testing/common.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace {

using storage_t =
    quorum::storage::storage<quorum::storage::rocksdb_storage_tag>;
using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;

quorum::schema::bytes_t make_key(const std::string& text) {
  return quorum::schema::bytes_t{text.begin(), text.end()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto entry = quorum::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, get_returns_nullopt_for_missing_keys) {
  auto db = quorum::testing::make_db_path("quorum_storage_missing");
  {
    auto storage =
        quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("absent");
    EXPECT_FALSE(storage
                     .get<uint64_t>(encoder,
                                    quorum::schema::make_bytes_view(key))
                     .has_value());
  }
  quorum::testing::remove_path(db);
}

TEST(storage_types, get_decodes_a_batched_value) {
  auto db = quorum::testing::make_db_path("quorum_storage_get");
  {
    auto storage =
        quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("counter");
    storage.write_batch({{key, encoder.encode(uint64_t{99})}});

    auto loaded =
        storage.get<uint64_t>(encoder, quorum::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 99u);
  }
  quorum::testing::remove_path(db);
}

TEST(storage_types, write_batch_lands_every_row) {
  auto db = quorum::testing::make_db_path("quorum_storage_batch");
  {
    auto storage =
        quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(db);
    auto entries = std::vector<quorum::storage::key_value_entry_t>{
        {make_key("A|1"), quorum::schema::bytes_t{0x01}},
        {make_key("A|2"), quorum::schema::bytes_t{0x02}},
        {make_key("B|1"), quorum::schema::bytes_t{0x03}}};
    storage.write_batch(entries);

    auto prefix = make_key("A|");
    auto listed =
        storage.list_by_prefix(quorum::schema::make_bytes_view(prefix));
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].first, make_key("A|1"));
    EXPECT_EQ(listed[0].second, (quorum::schema::bytes_t{0x01}));
    EXPECT_EQ(listed[1].first, make_key("A|2"));
  }
  quorum::testing::remove_path(db);
}

TEST(storage_types, rows_survive_reopen) {
  auto db = quorum::testing::make_db_path("quorum_storage_reopen");
  auto key = make_key("persisted");
  {
    auto storage =
        quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(db);
    storage.write_batch({{key, quorum::schema::bytes_t{0xAA, 0xBB}}});
  }
  {
    auto storage =
        quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(db);
    auto listed = storage.list_by_prefix(quorum::schema::make_bytes_view(key));
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].second, (quorum::schema::bytes_t{0xAA, 0xBB}));
  }
  quorum::testing::remove_path(db);
}

TEST(storage_types, empty_prefix_listing_is_empty_on_fresh_store) {
  auto db = quorum::testing::make_db_path("quorum_storage_empty");
  {
    auto storage =
        quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(db);
    auto prefix = make_key("nothing|");
    EXPECT_TRUE(
        storage.list_by_prefix(quorum::schema::make_bytes_view(prefix)).empty());
  }
  quorum::testing::remove_path(db);
}

TEST(storage_types, wallet_store_opens_with_integrity_checks) {
  auto db = quorum::testing::make_db_path("quorum_storage_options");
  {
    auto storage =
        quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(db);
    auto options = storage.database->GetOptions();
    EXPECT_TRUE(options.create_if_missing);
    EXPECT_TRUE(options.paranoid_checks);
    EXPECT_EQ(options.max_open_files, 64);
  }
  quorum::testing::remove_path(db);
}
