#pragma once
#include <stowage/merkle/merkle_tree.hpp>
#include <stowage/schema/batch_header.hpp>
#include <stowage/schema/batch_record.hpp>
#include <stowage/schema/blob.hpp>
#include <stowage/schema/blob_header.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <stowage/storage/retry.hpp>
#include <stowage/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace stowage::store {

class chunk_store;

/// Durability acknowledgement for one batch. Only `chunk_store::commit` can
/// issue one, and only after the batch is on disk.
class commit_receipt final {
 public:
  const stowage::schema::batch_header_t& batch_header() const;
  const stowage::schema::hash32_t& batch_header_hash() const;
  /// True when the batch was already held and nothing was written.
  bool already_stored() const;

 private:
  friend class chunk_store;

  commit_receipt(stowage::schema::batch_header_t batch_header,
                 stowage::schema::hash32_t batch_header_hash,
                 bool already_stored);

  stowage::schema::batch_header_t batch_header_;
  stowage::schema::hash32_t batch_header_hash_{};
  bool already_stored_{};
};

/// Staged writes of one batch; nothing is visible until committed.
class transaction final {
 public:
  const stowage::schema::batch_header_t& batch_header() const;
  const stowage::schema::hash32_t& batch_header_hash() const;

 private:
  friend class chunk_store;

  transaction(stowage::schema::batch_header_t batch_header,
              stowage::schema::hash32_t batch_header_hash,
              uint32_t blob_count);

  stowage::schema::batch_header_t batch_header_;
  stowage::schema::hash32_t batch_header_hash_{};
  uint32_t blob_count_{};
  uint32_t bundle_count_{};
  std::vector<stowage::storage::key_value_entry_t> entries_;
};

struct chunk_store_config final {
  stowage::schema::block_number_t custody_blocks{100800};
  stowage::storage::retry_policy retry;
};

/// Custody-bounded persistence of validated bundles.
///
/// Everything of a batch is keyed under its batch_header_hash and created in
/// one synced write, then deleted in one write when custody ends, so readers
/// see either the whole batch or none of it.
class chunk_store final {
 public:
  using storage_t =
      stowage::storage::storage<stowage::storage::rocksdb_storage_tag>;
  using view_t =
      stowage::storage::read_view<stowage::storage::rocksdb_storage_tag>;

  chunk_store(const storage_t& storage, chunk_store_config config);

  transaction begin(const stowage::schema::batch_header_t& batch_header,
                    uint32_t blob_count) const;
  void put(transaction& tx,
           uint32_t blob_index,
           stowage::schema::quorum_id_t quorum_id,
           const stowage::schema::bundle_t& chunks) const;
  void put_blob_header(transaction& tx,
                       uint32_t blob_index,
                       const stowage::schema::blob_header_t& header) const;
  void put_merkle(transaction& tx, const stowage::merkle::merkle_tree& tree) const;

  /// Write the transaction durably. When the batch already exists with
  /// byte-identical content the call succeeds without writing; different
  /// content is a validation error, as is a stored batch whose custody ended
  /// before `current_block_number`. Callers serialize commits per batch.
  stowage::schema::status_t commit(
      transaction tx,
      stowage::schema::block_number_t current_block_number,
      std::optional<commit_receipt>& receipt) const;

  /// Chunks of one blob x quorum, or not_found.
  stowage::schema::status_t get(
      const stowage::schema::hash32_t& batch_header_hash,
      uint32_t blob_index,
      stowage::schema::quorum_id_t quorum_id,
      stowage::schema::bundle_t& chunks,
      const view_t* view = nullptr) const;

  stowage::schema::status_t get_blob_header(
      const stowage::schema::hash32_t& batch_header_hash,
      uint32_t blob_index,
      std::optional<stowage::schema::blob_header_t>& header,
      const view_t* view = nullptr) const;

  stowage::schema::status_t get_batch(
      const stowage::schema::hash32_t& batch_header_hash,
      std::optional<stowage::schema::batch_record_t>& record,
      const view_t* view = nullptr) const;

  /// Delete every batch whose custody ended before `current_block_number`.
  stowage::schema::status_t expire(
      stowage::schema::block_number_t current_block_number,
      std::size_t& expired) const;

  static bool is_expired(const stowage::schema::batch_record_t& record,
                         stowage::schema::block_number_t current_block_number);

  view_t view() const;
  const chunk_store_config& config() const;

 private:
  stowage::schema::status_t matches_stored(
      const transaction& tx,
      const stowage::schema::batch_record_t& stored,
      const view_t& view) const;
  stowage::schema::status_t delete_batch(
      const stowage::schema::hash32_t& batch_header_hash,
      stowage::schema::block_number_t expiry_block) const;

  const storage_t& storage_;
  chunk_store_config config_;
};

}  // namespace stowage::store
