#pragma once
#include <stowage/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>

// Storage key layout. Every key of a batch embeds its batch_header_hash so
// that one prefix scan finds (and one write batch removes) all of it.
//
//   BATCH|<hash>                          batch record
//   BLOB|<hash>|<u32 blob_index>          blob header
//   BUNDLE|<hash>|<u32 blob_index>|<u8 q> chunks
//   MERKLE|<hash>                         merkle arena
//   EXPIRY|<u64 expiry_block>|<hash>      custody index (empty value)
namespace stowage::schema::key {

inline constexpr auto kBatchPrefix = std::string_view{"BATCH|"};
inline constexpr auto kBlobHeaderPrefix = std::string_view{"BLOB|"};
inline constexpr auto kBundlePrefix = std::string_view{"BUNDLE|"};
inline constexpr auto kMerklePrefix = std::string_view{"MERKLE|"};
inline constexpr auto kExpiryPrefix = std::string_view{"EXPIRY|"};

bytes_t make_batch_key(const hash32_t& batch_header_hash);
bytes_t make_blob_header_key(const hash32_t& batch_header_hash,
                             uint32_t blob_index);
/// Prefix covering every blob header of a batch.
bytes_t make_blob_header_prefix(const hash32_t& batch_header_hash);
bytes_t make_bundle_key(const hash32_t& batch_header_hash,
                        uint32_t blob_index,
                        quorum_id_t quorum_id);
/// Prefix covering every bundle of a batch.
bytes_t make_bundle_prefix(const hash32_t& batch_header_hash);
bytes_t make_merkle_key(const hash32_t& batch_header_hash);
bytes_t make_expiry_key(block_number_t expiry_block,
                        const hash32_t& batch_header_hash);
bytes_t make_expiry_prefix();

/// Split an expiry key into (expiry_block, batch_header_hash).
std::optional<std::pair<block_number_t, hash32_t>> parse_expiry_key(
    const bytes_view_t& key);

}  // namespace stowage::schema::key
