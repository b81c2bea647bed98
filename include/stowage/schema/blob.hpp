#pragma once
#include <stowage/schema/blob_header.hpp>
#include <stowage/schema/primitives.hpp>
#include <vector>

// Schema type: blob.
// A blob header with this node's bundles, one per quorum header and in the
// same order.
namespace stowage::schema {

/// All chunks of one blob for one quorum held by one node.
using bundle_t = std::vector<bytes_t>;

template <uint16_t Version>
struct blob;

template <>
struct blob<1> final {
  uint16_t version{1};
  blob_header_t header;
  std::vector<bundle_t> bundles;
};

using blob_t = blob<1>;

}  // namespace stowage::schema
