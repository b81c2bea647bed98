#pragma once
#include <stowage/schema/primitives.hpp>
#include <vector>

// Schema type: merkle proof.
// Sibling hashes from the leaf level up to (not including) the root.
namespace stowage::schema {

template <uint16_t Version>
struct merkle_proof;

template <>
struct merkle_proof<1> final {
  uint16_t version{1};
  std::vector<hash32_t> hashes;
  uint32_t index{};
};

using merkle_proof_t = merkle_proof<1>;

}  // namespace stowage::schema
