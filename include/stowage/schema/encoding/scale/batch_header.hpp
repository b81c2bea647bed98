#pragma once
#include <stowage/schema/batch_header.hpp>
#include <cstdint>
#include <tuple>

namespace stowage::schema::encoding::scale {

/// Reduced form: (batch_root, reference_block_number).
using batch_header_tuple_t = std::tuple<hash32_t, uint64_t>;

batch_header_tuple_t to_tuple(const batch_header_t& o);
batch_header_t from_tuple(const batch_header_tuple_t& t);

}  // namespace stowage::schema::encoding::scale
