#pragma once
#include <stowage/schema/batch_record.hpp>
#include <cstdint>
#include <tuple>

namespace stowage::schema::encoding::scale {

using batch_record_tuple_t = std::tuple<uint16_t, uint64_t, uint32_t, uint64_t>;

batch_record_tuple_t to_tuple(const batch_record_t& o);
batch_record_t from_tuple(const batch_record_tuple_t& t);

}  // namespace stowage::schema::encoding::scale
