#pragma once

#include <stowage/schema/blob.hpp>
#include <stowage/schema/blob_header.hpp>
#include <stowage/schema/merkle_proof.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <cstdint>

// Schema types: operation results.
// Envelopes returned by the dispersal and retrieval paths: a status plus the
// payload, which is only meaningful when the status is ok.
namespace stowage::schema {

template <uint16_t Version>
struct store_result;

template <>
struct store_result<1> final {
  uint16_t version{1};
  status_t status;
  hash32_t batch_header_hash{};
  bytes_t signature;
  // True when the batch was already held and nothing was written.
  bool already_stored{};
};

using store_result_t = store_result<1>;

template <uint16_t Version>
struct chunks_result;

template <>
struct chunks_result<1> final {
  uint16_t version{1};
  status_t status;
  bundle_t chunks;
};

using chunks_result_t = chunks_result<1>;

template <uint16_t Version>
struct blob_header_result;

template <>
struct blob_header_result<1> final {
  uint16_t version{1};
  status_t status;
  blob_header_t header;
  merkle_proof_t proof;
};

using blob_header_result_t = blob_header_result<1>;

}  // namespace stowage::schema
