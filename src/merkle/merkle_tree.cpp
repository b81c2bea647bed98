#include <stowage/blake3/hash.hpp>
#include <stowage/merkle/merkle_tree.hpp>

#include <algorithm>
#include <bit>
#include <string>

namespace stowage::merkle {

merkle_tree::merkle_tree(const uint32_t leaf_count,
                         const uint32_t width,
                         std::vector<stowage::schema::hash32_t> nodes)
    : leaf_count_{leaf_count}, width_{width}, nodes_{std::move(nodes)} {}

merkle_tree merkle_tree::build(
    std::span<const stowage::schema::hash32_t> blob_header_hashes) {
  auto leaf_count = static_cast<uint32_t>(blob_header_hashes.size());
  auto width = std::bit_ceil(std::max<uint32_t>(leaf_count, 1));
  auto nodes = std::vector<stowage::schema::hash32_t>(2 * width);

  for (uint32_t i = 0; i < leaf_count; ++i) {
    nodes[width + i] = leaf_hash(blob_header_hashes[i]);
  }
  for (auto k = width - 1; k >= 1; --k) {
    nodes[k] = stowage::blake3::hash(nodes[2 * k], nodes[(2 * k) + 1]);
  }
  return merkle_tree{leaf_count, width, std::move(nodes)};
}

std::optional<merkle_tree> merkle_tree::from_arena(
    const uint32_t leaf_count,
    std::vector<stowage::schema::hash32_t> nodes) {
  auto width = std::bit_ceil(std::max<uint32_t>(leaf_count, 1));
  if (nodes.size() != 2 * static_cast<size_t>(width)) {
    return std::nullopt;
  }
  return merkle_tree{leaf_count, width, std::move(nodes)};
}

const stowage::schema::hash32_t& merkle_tree::root() const {
  return nodes_[1];
}

uint32_t merkle_tree::leaf_count() const {
  return leaf_count_;
}

const std::vector<stowage::schema::hash32_t>& merkle_tree::nodes() const {
  return nodes_;
}

stowage::schema::status_t merkle_tree::proof(
    const uint32_t index,
    stowage::schema::merkle_proof_t& out) const {
  if (index >= leaf_count_) {
    return stowage::schema::make_error(
        stowage::schema::error_code::blob_index_out_of_range,
        "blob index " + std::to_string(index) + " out of range for " +
            std::to_string(leaf_count_) + " leaves");
  }
  out = stowage::schema::merkle_proof_t{};
  out.index = index;
  for (auto position = width_ + index; position > 1; position >>= 1u) {
    out.hashes.push_back(nodes_[position ^ 1u]);
  }
  return stowage::schema::make_ok();
}

stowage::schema::hash32_t leaf_hash(
    const stowage::schema::hash32_t& blob_header_hash) {
  return stowage::blake3::hash(stowage::schema::bytes_view_t{
      blob_header_hash.data(), blob_header_hash.size()});
}

bool verify(const stowage::schema::hash32_t& blob_header_hash,
            const stowage::schema::merkle_proof_t& proof,
            const stowage::schema::hash32_t& root) {
  if (proof.hashes.size() < 32 &&
      (static_cast<uint64_t>(proof.index) >> proof.hashes.size()) != 0) {
    return false;
  }
  auto node = leaf_hash(blob_header_hash);
  auto position = proof.index;
  for (const auto& sibling : proof.hashes) {
    node = (position % 2 == 0) ? stowage::blake3::hash(node, sibling)
                               : stowage::blake3::hash(sibling, node);
    position >>= 1u;
  }
  return node == root;
}

}  // namespace stowage::merkle
