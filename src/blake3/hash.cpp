#include <blake3.h>
#include <stowage/blake3/hash.hpp>

namespace stowage::blake3 {

stowage::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = stowage::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<stowage::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

stowage::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = stowage::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

stowage::schema::hash32_t hash(const stowage::schema::hash32_t& left,
                               const stowage::schema::hash32_t& right) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, left.data(), left.size());
  blake3_hasher_update(&hasher, right.data(), right.size());
  auto output = stowage::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace stowage::blake3
