#include <stowage/schema/encoding/scale/batch_record.hpp>

namespace stowage::schema::encoding::scale {

batch_record_tuple_t to_tuple(const batch_record_t& o) {
  return {o.version, o.reference_block_number, o.blob_count, o.expiry_block};
}

batch_record_t from_tuple(const batch_record_tuple_t& t) {
  return batch_record_t{.version = std::get<0>(t),
                        .reference_block_number = std::get<1>(t),
                        .blob_count = std::get<2>(t),
                        .expiry_block = std::get<3>(t)};
}

}  // namespace stowage::schema::encoding::scale
