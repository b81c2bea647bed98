#pragma once
#include <stowage/schema/merkle_proof.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace stowage::merkle {

/// Binary inclusion tree over a batch's blob header hashes.
///
/// Nodes live in one index-addressed array: with `width` the smallest power
/// of two >= leaf count, `nodes[width + i]` holds leaf `i`, padding leaves are
/// all-zero, `nodes[k] = H(nodes[2k] || nodes[2k + 1])` and `nodes[1]` is the
/// root. `nodes[0]` is unused.
class merkle_tree final {
 public:
  /// Build from blob header hashes in batch order.
  static merkle_tree build(
      std::span<const stowage::schema::hash32_t> blob_header_hashes);

  /// Rehydrate a persisted arena; std::nullopt when its shape is inconsistent.
  static std::optional<merkle_tree> from_arena(
      uint32_t leaf_count,
      std::vector<stowage::schema::hash32_t> nodes);

  const stowage::schema::hash32_t& root() const;
  uint32_t leaf_count() const;
  const std::vector<stowage::schema::hash32_t>& nodes() const;

  /// Sibling path for leaf `index`, leaf level first.
  stowage::schema::status_t proof(uint32_t index,
                                  stowage::schema::merkle_proof_t& out) const;

 private:
  merkle_tree(uint32_t leaf_count,
              uint32_t width,
              std::vector<stowage::schema::hash32_t> nodes);

  uint32_t leaf_count_{};
  uint32_t width_{1};
  std::vector<stowage::schema::hash32_t> nodes_;
};

/// Leaf value committed for a blob header hash.
stowage::schema::hash32_t leaf_hash(
    const stowage::schema::hash32_t& blob_header_hash);

/// Fold `proof` over the leaf of `blob_header_hash` and compare with `root`.
bool verify(const stowage::schema::hash32_t& blob_header_hash,
            const stowage::schema::merkle_proof_t& proof,
            const stowage::schema::hash32_t& root);

}  // namespace stowage::merkle
