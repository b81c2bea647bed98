#pragma once
#include <grpcpp/grpcpp.h>
#include <stowage/node/node.pb.h>
#include <stowage/schema/batch_header.hpp>
#include <stowage/schema/blob.hpp>
#include <stowage/schema/merkle_proof.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <optional>
#include <string>
#include <vector>

// Conversions between the wire messages of stowage.node and schema types.
namespace stowage::rpc {

/// Decode a store request. Fields that do not fit the schema (a batch root
/// that is not 32 bytes, a quorum id or threshold above 255) are validation
/// errors.
stowage::schema::status_t from_proto(
    const stowage::node::StoreChunksRequest& request,
    stowage::schema::batch_header_t& header,
    std::vector<stowage::schema::blob_t>& blobs);

void to_proto(const stowage::schema::blob_header_t& header,
              stowage::node::BlobHeader* out);
void to_proto(const stowage::schema::merkle_proof_t& proof,
              stowage::node::MerkleProof* out);

std::optional<stowage::schema::hash32_t> parse_batch_header_hash(
    const std::string& value);

grpc::StatusCode to_grpc_code(stowage::schema::error_code code);
grpc::Status to_grpc_status(const stowage::schema::status_t& status);

}  // namespace stowage::rpc
