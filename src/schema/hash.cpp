#include <stowage/blake3/hash.hpp>
#include <stowage/schema/encoding/scale/batch_header.hpp>
#include <stowage/schema/encoding/scale/blob_header.hpp>
#include <stowage/schema/encoding/scale/encoder.hpp>
#include <stowage/schema/hash.hpp>

namespace stowage::schema {

hash32_t hash_batch_header(const batch_header_t& header) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(encoding::scale::to_tuple(header));
  return stowage::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

hash32_t hash_blob_header(const blob_header_t& header) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(encoding::scale::to_tuple(header));
  return stowage::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace stowage::schema
