#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <stowage/common/critical.hpp>
#include <stowage/storage/rocksdb/storage.hpp>

namespace stowage::storage {

namespace {

// Every batch is written with sync=true, so the WAL stays on and corruption
// found while replaying it fails the open instead of silently dropping
// records that were already attested.
ROCKSDB_NAMESPACE::Options make_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.wal_recovery_mode =
      ROCKSDB_NAMESPACE::WALRecoveryMode::kAbsoluteConsistency;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  // Keys are read by exact hash or short prefix scans; bloom filters keep
  // lookups of unknown batches off disk.
  auto table = ROCKSDB_NAMESPACE::BlockBasedTableOptions{};
  table.filter_policy.reset(ROCKSDB_NAMESPACE::NewBloomFilterPolicy(10));
  options.table_factory.reset(
      ROCKSDB_NAMESPACE::NewBlockBasedTableFactory(table));
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = detail::to_status(
      ROCKSDB_NAMESPACE::DB::Open(make_options(), std::string{path}, &database),
      "open " + std::string{path});
  if (!stowage::schema::is_ok(status)) {
    stowage::common::critical("chunk store unavailable", status);
  }
  store.database.reset(database);
  spdlog::info("Opened chunk store at {} (paranoid checks, synced WAL)", path);
  return store;
}

}  // namespace stowage::storage
