#pragma once
#include <stowage/commitment/pairing_backend.hpp>
#include <stowage/schema/assignment.hpp>
#include <stowage/schema/blob.hpp>
#include <stowage/schema/blob_quorum_info.hpp>
#include <stowage/schema/status.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace stowage::commitment {

/// One quorum of a blob that this node holds chunks for.
struct assigned_bundle final {
  std::size_t quorum_position{};
  stowage::schema::assignment_t assignment;
};

/// Chunk length for a quorum split into `total_chunks`. std::nullopt unless
/// the division is exact, non-zero and a power of two.
std::optional<uint32_t> chunk_length(
    const stowage::schema::blob_quorum_info_t& quorum,
    uint32_t total_chunks);

/// Smallest encoded length that tolerates the quorum's thresholds.
uint64_t min_encoded_length(const stowage::schema::blob_quorum_info_t& quorum,
                            uint32_t length);

/// Frame size in bytes for `chunk_length` coefficients.
constexpr std::size_t frame_size(const uint32_t chunk_length) {
  return stowage::schema::kFrameProofSize +
         (static_cast<std::size_t>(chunk_length) *
          stowage::schema::kSymbolSize);
}

class commitment_verifier final {
 public:
  explicit commitment_verifier(std::shared_ptr<const pairing_backend> backend);

  /// Check every assigned bundle of `blob` and the blob's length proof. Any
  /// failure is a commitment error.
  stowage::schema::status_t verify_blob(
      const stowage::schema::blob_t& blob,
      const std::vector<assigned_bundle>& assigned) const;

 private:
  std::shared_ptr<const pairing_backend> backend_;
};

}  // namespace stowage::commitment
