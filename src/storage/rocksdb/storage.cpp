#include <quorum/common/critical.hpp>
#include <quorum/storage/rocksdb/storage.hpp>

namespace quorum::storage {

namespace {

// A wallet store is small and written one operation batch at a time; favour
// integrity checks over throughput tuning.
ROCKSDB_NAMESPACE::Options make_wallet_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.max_open_files = 64;
  options.keep_log_file_num = 4;
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = make_wallet_options();
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Cannot open wallet store at {}: {}", path,
                  status.ToString());
    quorum::common::critical("Failed to open wallet store");
  }
  spdlog::info("Opened wallet store at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace quorum::storage
