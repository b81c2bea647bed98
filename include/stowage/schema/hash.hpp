#pragma once
#include <stowage/schema/batch_header.hpp>
#include <stowage/schema/blob_header.hpp>
#include <stowage/schema/primitives.hpp>

// Canonical digests. Both are BLAKE3-256 over the SCALE encoding of the
// reduced form; changing either invalidates every stored key and every
// published batch root.
namespace stowage::schema {

/// Digest of (batch_root, reference_block_number). Sole key of a batch.
hash32_t hash_batch_header(const batch_header_t& header);

/// Digest of the full blob header.
hash32_t hash_blob_header(const blob_header_t& header);

}  // namespace stowage::schema
