#pragma once
#include <stowage/schema/blob_quorum_info.hpp>
#include <stowage/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: blob header.
// Commitment to a user blob plus the quorums it opts into. `length` counts
// field-element symbols of the original blob.
namespace stowage::schema {

template <uint16_t Version>
struct blob_header;

template <>
struct blob_header<1> final {
  uint16_t version{1};
  bytes_t commitment;
  bytes_t length_proof;
  uint32_t length{};
  std::vector<blob_quorum_info_t> quorum_headers;
  std::string account_id;
};

using blob_header_t = blob_header<1>;

}  // namespace stowage::schema
