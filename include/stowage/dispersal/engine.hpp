#pragma once
#include <stowage/assignment/snapshot_registry.hpp>
#include <stowage/attestation/attestor.hpp>
#include <stowage/commitment/commitment_verifier.hpp>
#include <stowage/dispersal/batch_lock_table.hpp>
#include <stowage/schema/batch_header.hpp>
#include <stowage/schema/blob.hpp>
#include <stowage/schema/results.hpp>
#include <stowage/store/chunk_store.hpp>
#include <stowage/validation/batch_validator.hpp>
#include <chrono>
#include <cstddef>
#include <vector>

namespace stowage::dispersal {

struct engine_config final {
  std::size_t verification_threads{1};
  std::chrono::milliseconds timeout{30000};
};

/// Store pipeline for one batch.
///
/// Per batch_header_hash the pipeline is serialized: lock, capture the
/// operator snapshot for the reference block, validate, verify blobs in
/// parallel, stage and commit, then sign the commit receipt. Nothing is
/// written unless every blob passes, and nothing is signed unless the write
/// is durable. Repeating a stored batch returns the same attestation.
class engine final {
 public:
  using clock_type = batch_lock_table::clock_type;

  engine(const stowage::assignment::snapshot_registry& registry,
         const stowage::validation::batch_validator& validator,
         const stowage::commitment::commitment_verifier& verifier,
         const stowage::store::chunk_store& store,
         const stowage::attestation::attestor& attestor,
         engine_config config);

  /// Store with the configured timeout.
  stowage::schema::store_result_t store_chunks(
      const stowage::schema::batch_header_t& header,
      const std::vector<stowage::schema::blob_t>& blobs);

  stowage::schema::store_result_t store_chunks(
      const stowage::schema::batch_header_t& header,
      const std::vector<stowage::schema::blob_t>& blobs,
      clock_type::time_point deadline);

  const engine_config& config() const;

 private:
  stowage::schema::status_t verify_blobs(
      const std::vector<stowage::schema::blob_t>& blobs,
      const stowage::validation::batch_plan& plan,
      clock_type::time_point deadline) const;

  stowage::schema::status_t persist(
      const stowage::schema::batch_header_t& header,
      const std::vector<stowage::schema::blob_t>& blobs,
      const stowage::validation::batch_plan& plan,
      stowage::schema::block_number_t current_block_number,
      std::optional<stowage::store::commit_receipt>& receipt) const;

  const stowage::assignment::snapshot_registry& registry_;
  const stowage::validation::batch_validator& validator_;
  const stowage::commitment::commitment_verifier& verifier_;
  const stowage::store::chunk_store& store_;
  const stowage::attestation::attestor& attestor_;
  engine_config config_;
  batch_lock_table locks_;
};

}  // namespace stowage::dispersal
