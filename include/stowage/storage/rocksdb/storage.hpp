#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <stowage/common/critical.hpp>
#include <stowage/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace stowage::storage {

namespace detail {

inline stowage::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const stowage::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline stowage::schema::status_t to_status(
    const ROCKSDB_NAMESPACE::Status& status,
    const std::string_view operation) {
  if (status.ok()) {
    return stowage::schema::make_ok();
  }
  return stowage::schema::make_error(
      stowage::schema::error_code::storage,
      std::string{operation} + ": " + status.ToString());
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct read_view<rocksdb_storage_tag> final {
  read_view(ROCKSDB_NAMESPACE::DB* database,
            const ROCKSDB_NAMESPACE::Snapshot* snapshot)
      : database_{database}, snapshot_{snapshot} {}

  read_view(const read_view&) = delete;
  read_view& operator=(const read_view&) = delete;
  read_view(read_view&& other) noexcept
      : database_{other.database_}, snapshot_{other.snapshot_} {
    other.database_ = nullptr;
    other.snapshot_ = nullptr;
  }
  read_view& operator=(read_view&&) = delete;

  ~read_view() {
    if (database_ != nullptr && snapshot_ != nullptr) {
      database_->ReleaseSnapshot(snapshot_);
    }
  }

  ROCKSDB_NAMESPACE::ReadOptions options() const {
    auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
    read_options.snapshot = snapshot_;
    return read_options;
  }

 private:
  ROCKSDB_NAMESPACE::DB* database_{nullptr};
  const ROCKSDB_NAMESPACE::Snapshot* snapshot_{nullptr};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  read_view<rocksdb_storage_tag> view() const;

  stowage::schema::status_t read(
      const stowage::schema::bytes_view_t& key,
      std::optional<stowage::schema::bytes_t>& value,
      const read_view<rocksdb_storage_tag>* view = nullptr) const;

  template <typename Encoder, typename T>
  stowage::schema::status_t read(
      Encoder& encoder,
      const stowage::schema::bytes_view_t& key,
      std::optional<T>& value,
      const read_view<rocksdb_storage_tag>* view = nullptr) const;

  stowage::schema::status_t write(const write_batch& batch) const;

  template <typename Visitor>
  stowage::schema::status_t scan_prefix(
      const stowage::schema::bytes_view_t& prefix,
      Visitor&& visitor,
      const read_view<rocksdb_storage_tag>* view = nullptr) const;

 private:
  ROCKSDB_NAMESPACE::ReadOptions read_options(
      const read_view<rocksdb_storage_tag>* view) const {
    return view != nullptr ? view->options() : ROCKSDB_NAMESPACE::ReadOptions{};
  }
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline read_view<rocksdb_storage_tag> storage<rocksdb_storage_tag>::view()
    const {
  if (!database) {
    stowage::common::critical("RocksDB database is not initialized");
  }
  return read_view<rocksdb_storage_tag>{database.get(),
                                        database->GetSnapshot()};
}

inline stowage::schema::status_t storage<rocksdb_storage_tag>::read(
    const stowage::schema::bytes_view_t& key,
    std::optional<stowage::schema::bytes_t>& value,
    const read_view<rocksdb_storage_tag>* view) const {
  if (!database) {
    stowage::common::critical("RocksDB database is not initialized");
  }
  value.reset();
  auto raw = std::string{};
  auto status = database->Get(read_options(view), detail::to_slice(key), &raw);
  if (status.IsNotFound()) {
    return stowage::schema::make_ok();
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    return detail::to_status(status, "get");
  }
  value = stowage::schema::make_bytes(raw);
  return stowage::schema::make_ok();
}

template <typename Encoder, typename T>
stowage::schema::status_t storage<rocksdb_storage_tag>::read(
    Encoder& encoder,
    const stowage::schema::bytes_view_t& key,
    std::optional<T>& value,
    const read_view<rocksdb_storage_tag>* view) const {
  value.reset();
  auto raw = std::optional<stowage::schema::bytes_t>{};
  auto status = read(key, raw, view);
  if (!stowage::schema::is_ok(status) || !raw) {
    return status;
  }
  value = encoder.template try_decode<T>(
      stowage::schema::bytes_view_t{raw->data(), raw->size()});
  if (!value) {
    spdlog::error("Failed decoding stored value for key '{}'",
                  stowage::schema::to_hex(key));
    return stowage::schema::make_error(stowage::schema::error_code::storage,
                                       "corrupt record");
  }
  return stowage::schema::make_ok();
}

inline stowage::schema::status_t storage<rocksdb_storage_tag>::write(
    const write_batch& batch) const {
  if (!database) {
    stowage::common::critical("RocksDB database is not initialized");
  }
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto status = rocks_batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      return detail::to_status(status, "stage delete");
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto status =
        rocks_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      return detail::to_status(status, "stage put");
    }
  }

  // A synced write is the durability acknowledgement callers rely on.
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &rocks_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write batch to RocksDB: {}",
                  status.ToString());
  }
  return detail::to_status(status, "write");
}

template <typename Visitor>
stowage::schema::status_t storage<rocksdb_storage_tag>::scan_prefix(
    const stowage::schema::bytes_view_t& prefix,
    Visitor&& visitor,
    const read_view<rocksdb_storage_tag>* view) const {
  if (!database) {
    stowage::common::critical("RocksDB database is not initialized");
  }
  auto prefix_string = stowage::schema::make_string(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options(view))};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto key = stowage::schema::bytes_view_t{
        reinterpret_cast<const uint8_t*>(iterator->key().data()),
        iterator->key().size()};
    auto value = stowage::schema::bytes_view_t{
        reinterpret_cast<const uint8_t*>(iterator->value().data()),
        iterator->value().size()};
    if (!visitor(key, value)) {
      break;
    }
    iterator->Next();
  }
  return detail::to_status(iterator->status(), "scan");
}

}  // namespace stowage::storage
