#pragma once
#include <stowage/schema/primitives.hpp>

// Schema type: batch header.
// One dispersal round: the Merkle root over the batch's blob header hashes and
// the chain height that fixes assignment and custody.
namespace stowage::schema {

template <uint16_t Version>
struct batch_header;

template <>
struct batch_header<1> final {
  uint16_t version{1};
  hash32_t batch_root{};
  block_number_t reference_block_number{};
};

using batch_header_t = batch_header<1>;

}  // namespace stowage::schema
