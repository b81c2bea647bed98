#pragma once
#include <stowage/assignment/snapshot_registry.hpp>
#include <stowage/merkle/merkle_index.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/results.hpp>
#include <stowage/store/chunk_store.hpp>
#include <cstdint>

namespace stowage::retrieval {

/// Read-only query surface over stored batches.
///
/// Each call reads under one storage snapshot, so a batch being committed or
/// expired concurrently is seen whole or not at all. A batch whose custody
/// ended is reported missing even before the expiry pass reclaims it.
class service final {
 public:
  service(const stowage::store::chunk_store& store,
          const stowage::merkle::merkle_index& index,
          const stowage::assignment::snapshot_registry& registry);

  stowage::schema::chunks_result_t retrieve_chunks(
      const stowage::schema::hash32_t& batch_header_hash,
      uint32_t blob_index,
      uint32_t quorum_id) const;

  /// Blob header plus its inclusion proof against the batch root.
  stowage::schema::blob_header_result_t get_blob_header(
      const stowage::schema::hash32_t& batch_header_hash,
      uint32_t blob_index,
      uint32_t quorum_id) const;

 private:
  stowage::schema::status_t find_header(
      const stowage::schema::hash32_t& batch_header_hash,
      uint32_t blob_index,
      uint32_t quorum_id,
      stowage::schema::blob_header_t& header,
      const stowage::store::chunk_store::view_t& view) const;

  const stowage::store::chunk_store& store_;
  const stowage::merkle::merkle_index& index_;
  const stowage::assignment::snapshot_registry& registry_;
};

}  // namespace stowage::retrieval
