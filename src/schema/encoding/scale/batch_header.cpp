#include <stowage/schema/encoding/scale/batch_header.hpp>

namespace stowage::schema::encoding::scale {

batch_header_tuple_t to_tuple(const batch_header_t& o) {
  return batch_header_tuple_t{o.batch_root, o.reference_block_number};
}

batch_header_t from_tuple(const batch_header_tuple_t& t) {
  return batch_header_t{.batch_root = std::get<0>(t),
                        .reference_block_number = std::get<1>(t)};
}

}  // namespace stowage::schema::encoding::scale
