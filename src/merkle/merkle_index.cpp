#include <spdlog/spdlog.h>
#include <stowage/merkle/merkle_index.hpp>
#include <stowage/schema/encoding/scale/encoder.hpp>
#include <stowage/schema/hash.hpp>
#include <stowage/schema/key/keys.hpp>

#include <tuple>

namespace stowage::merkle {

namespace {

using arena_tuple_t =
    std::tuple<uint32_t, std::vector<stowage::schema::hash32_t>>;

}  // namespace

merkle_index::merkle_index(const storage_t& storage) : storage_{storage} {}

merkle_tree merkle_index::build(
    const std::vector<stowage::schema::blob_header_t>& headers) {
  auto hashes = std::vector<stowage::schema::hash32_t>{};
  hashes.reserve(headers.size());
  for (const auto& header : headers) {
    hashes.push_back(stowage::schema::hash_blob_header(header));
  }
  return merkle_tree::build(hashes);
}

stowage::storage::key_value_entry_t merkle_index::make_entry(
    const stowage::schema::hash32_t& batch_header_hash,
    const merkle_tree& tree) {
  auto encoder = stowage::schema::encoding::scale_encoder_t{};
  return stowage::storage::key_value_entry_t{
      stowage::schema::key::make_merkle_key(batch_header_hash),
      encoder.encode(arena_tuple_t{tree.leaf_count(), tree.nodes()})};
}

stowage::schema::status_t merkle_index::load(
    const stowage::schema::hash32_t& batch_header_hash,
    std::optional<merkle_tree>& tree,
    const view_t* view) const {
  tree.reset();
  auto encoder = stowage::schema::encoding::scale_encoder_t{};
  auto key = stowage::schema::key::make_merkle_key(batch_header_hash);
  auto arena = std::optional<arena_tuple_t>{};
  auto status = storage_.read(
      encoder, stowage::schema::bytes_view_t{key.data(), key.size()}, arena,
      view);
  if (!stowage::schema::is_ok(status) || !arena) {
    return status;
  }
  tree = merkle_tree::from_arena(std::get<0>(*arena),
                                 std::move(std::get<1>(*arena)));
  if (!tree) {
    spdlog::error("Merkle arena for batch {} has an inconsistent shape",
                  stowage::schema::to_hex(batch_header_hash));
    return stowage::schema::make_error(stowage::schema::error_code::storage,
                                       "corrupt merkle arena");
  }
  return stowage::schema::make_ok();
}

stowage::schema::status_t merkle_index::get_proof(
    const stowage::schema::hash32_t& batch_header_hash,
    const uint32_t index,
    stowage::schema::merkle_proof_t& proof,
    const view_t* view) const {
  auto tree = std::optional<merkle_tree>{};
  auto status = load(batch_header_hash, tree, view);
  if (!stowage::schema::is_ok(status)) {
    return status;
  }
  if (!tree) {
    return stowage::schema::make_error(stowage::schema::error_code::not_found,
                                       "unknown batch");
  }
  return tree->proof(index, proof);
}

}  // namespace stowage::merkle
