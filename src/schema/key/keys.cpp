#include <stowage/schema/key/builder.hpp>
#include <stowage/schema/key/keys.hpp>

#include <algorithm>

namespace stowage::schema::key {

bytes_t make_batch_key(const hash32_t& batch_header_hash) {
  auto b = builder{};
  b.write(kBatchPrefix);
  b.write(batch_header_hash);
  return b.data;
}

bytes_t make_blob_header_key(const hash32_t& batch_header_hash,
                             const uint32_t blob_index) {
  auto b = builder{};
  b.write(kBlobHeaderPrefix);
  b.write(batch_header_hash);
  b.write("|");
  b.write(blob_index);
  return b.data;
}

bytes_t make_blob_header_prefix(const hash32_t& batch_header_hash) {
  auto b = builder{};
  b.write(kBlobHeaderPrefix);
  b.write(batch_header_hash);
  b.write("|");
  return b.data;
}

bytes_t make_bundle_key(const hash32_t& batch_header_hash,
                        const uint32_t blob_index,
                        const quorum_id_t quorum_id) {
  auto b = builder{};
  b.write(kBundlePrefix);
  b.write(batch_header_hash);
  b.write("|");
  b.write(blob_index);
  b.write("|");
  b.write(quorum_id);
  return b.data;
}

bytes_t make_bundle_prefix(const hash32_t& batch_header_hash) {
  auto b = builder{};
  b.write(kBundlePrefix);
  b.write(batch_header_hash);
  b.write("|");
  return b.data;
}

bytes_t make_merkle_key(const hash32_t& batch_header_hash) {
  auto b = builder{};
  b.write(kMerklePrefix);
  b.write(batch_header_hash);
  return b.data;
}

bytes_t make_expiry_key(const block_number_t expiry_block,
                        const hash32_t& batch_header_hash) {
  auto b = builder{};
  b.write(kExpiryPrefix);
  b.write(expiry_block);
  b.write("|");
  b.write(batch_header_hash);
  return b.data;
}

bytes_t make_expiry_prefix() {
  auto b = builder{};
  b.write(kExpiryPrefix);
  return b.data;
}

std::optional<std::pair<block_number_t, hash32_t>> parse_expiry_key(
    const bytes_view_t& key) {
  constexpr auto kExpected =
      kExpiryPrefix.size() + sizeof(block_number_t) + 1 + sizeof(hash32_t);
  if (key.size() != kExpected ||
      make_string_view(key.first(kExpiryPrefix.size())) != kExpiryPrefix) {
    return std::nullopt;
  }
  auto cursor = key.subspan(kExpiryPrefix.size());
  auto block = block_number_t{};
  for (size_t i = 0; i < sizeof(block_number_t); ++i) {
    block = (block << 8u) | cursor[i];
  }
  cursor = cursor.subspan(sizeof(block_number_t));
  if (cursor[0] != '|') {
    return std::nullopt;
  }
  cursor = cursor.subspan(1);
  auto hash = hash32_t{};
  std::copy(std::begin(cursor), std::end(cursor), std::begin(hash));
  return std::pair{block, hash};
}

}  // namespace stowage::schema::key
