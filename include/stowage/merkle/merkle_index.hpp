#pragma once
#include <stowage/merkle/merkle_tree.hpp>
#include <stowage/schema/blob_header.hpp>
#include <stowage/schema/merkle_proof.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <stowage/storage/rocksdb/storage.hpp>
#include <optional>
#include <vector>

namespace stowage::merkle {

/// Builds, persists and serves the inclusion tree of each stored batch.
///
/// The arena is written by the chunk store as part of the batch's single
/// commit; this class only produces the entry and reads it back.
class merkle_index final {
 public:
  using storage_t = stowage::storage::storage<stowage::storage::rocksdb_storage_tag>;
  using view_t =
      stowage::storage::read_view<stowage::storage::rocksdb_storage_tag>;

  explicit merkle_index(const storage_t& storage);

  /// Tree over the headers, in batch order.
  static merkle_tree build(
      const std::vector<stowage::schema::blob_header_t>& headers);

  /// Storage entry holding `tree` under `batch_header_hash`.
  static stowage::storage::key_value_entry_t make_entry(
      const stowage::schema::hash32_t& batch_header_hash,
      const merkle_tree& tree);

  /// Load the tree of a batch; `tree` stays empty when the batch is unknown.
  stowage::schema::status_t load(
      const stowage::schema::hash32_t& batch_header_hash,
      std::optional<merkle_tree>& tree,
      const view_t* view = nullptr) const;

  /// Proof for blob `index` of a stored batch. Unknown batch is not_found,
  /// `index >= blob_count` is blob_index_out_of_range.
  stowage::schema::status_t get_proof(
      const stowage::schema::hash32_t& batch_header_hash,
      uint32_t index,
      stowage::schema::merkle_proof_t& proof,
      const view_t* view = nullptr) const;

 private:
  const storage_t& storage_;
};

}  // namespace stowage::merkle
