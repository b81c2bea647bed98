#pragma once
#include <stowage/schema/primitives.hpp>
#include <cstdint>

// Schema type: batch record.
// Stored once per batch; its presence marks the batch as committed.
namespace stowage::schema {

template <uint16_t Version>
struct batch_record;

template <>
struct batch_record<1> final {
  uint16_t version{1};
  block_number_t reference_block_number{};
  uint32_t blob_count{};
  // Last chain height at which the batch is still in custody.
  block_number_t expiry_block{};
};

using batch_record_t = batch_record<1>;

}  // namespace stowage::schema
