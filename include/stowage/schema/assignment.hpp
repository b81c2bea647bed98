#pragma once
#include <stowage/schema/primitives.hpp>
#include <cstdint>

// Schema type: assignment.
// Contiguous range of chunk indices of one blob x quorum held by this node.
namespace stowage::schema {

template <uint16_t Version>
struct assignment;

template <>
struct assignment<1> final {
  uint16_t version{1};
  uint32_t start_index{};
  uint32_t num_chunks{};
  uint32_t total_chunks{};
};

using assignment_t = assignment<1>;

}  // namespace stowage::schema
