#pragma once
#include <stowage/schema/primitives.hpp>

// Schema type: blob quorum info.
// Security and encoding parameters of one quorum a blob participates in.
// Thresholds are percentages of quorum stake.
namespace stowage::schema {

template <uint16_t Version>
struct blob_quorum_info;

template <>
struct blob_quorum_info<1> final {
  uint16_t version{1};
  quorum_id_t quorum_id{};
  uint8_t adversary_threshold{};
  uint32_t quantization_factor{};
  uint32_t encoded_blob_length{};
  uint8_t quorum_threshold{};
  uint32_t ratelimit{};
};

using blob_quorum_info_t = blob_quorum_info<1>;

}  // namespace stowage::schema
