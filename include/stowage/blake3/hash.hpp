#pragma once
#include <stowage/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace stowage::blake3 {

stowage::schema::hash32_t hash(const std::string_view& str);
stowage::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash of the concatenation `left || right`.
stowage::schema::hash32_t hash(const stowage::schema::hash32_t& left,
                               const stowage::schema::hash32_t& right);

}  // namespace stowage::blake3
