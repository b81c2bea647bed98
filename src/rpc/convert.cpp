#include <stowage/rpc/convert.hpp>

namespace stowage::rpc {

namespace {

stowage::schema::status_t invalid(std::string log) {
  return stowage::schema::make_error(stowage::schema::error_code::validation,
                                     std::move(log));
}

bool fits_u8(const uint32_t value) {
  return value <= 0xFFu;
}

stowage::schema::status_t from_proto(
    const stowage::node::BlobQuorumInfo& quorum,
    stowage::schema::blob_quorum_info_t& out) {
  if (quorum.quorum_id() > stowage::schema::kMaxQuorumId) {
    return invalid("quorum id " + std::to_string(quorum.quorum_id()) +
                   " out of range");
  }
  if (!fits_u8(quorum.adversary_threshold()) ||
      !fits_u8(quorum.quorum_threshold())) {
    return invalid("quorum " + std::to_string(quorum.quorum_id()) +
                   " threshold out of range");
  }
  out = stowage::schema::blob_quorum_info_t{
      .quorum_id =
          static_cast<stowage::schema::quorum_id_t>(quorum.quorum_id()),
      .adversary_threshold =
          static_cast<uint8_t>(quorum.adversary_threshold()),
      .quantization_factor = quorum.quantization_factor(),
      .encoded_blob_length = quorum.encoded_blob_length(),
      .quorum_threshold = static_cast<uint8_t>(quorum.quorum_threshold()),
      .ratelimit = quorum.ratelimit()};
  return stowage::schema::make_ok();
}

}  // namespace

stowage::schema::status_t from_proto(
    const stowage::node::StoreChunksRequest& request,
    stowage::schema::batch_header_t& header,
    std::vector<stowage::schema::blob_t>& blobs) {
  blobs.clear();
  if (!request.has_batch_header()) {
    return invalid("missing batch header");
  }
  auto root = stowage::schema::try_make_hash32(
      stowage::schema::make_bytes_view(request.batch_header().batch_root()));
  if (!root) {
    return invalid("batch root must be 32 bytes");
  }
  header = stowage::schema::batch_header_t{
      .batch_root = *root,
      .reference_block_number =
          request.batch_header().reference_block_number()};

  blobs.reserve(request.blobs_size());
  for (const auto& message : request.blobs()) {
    auto blob = stowage::schema::blob_t{};
    const auto& source = message.header();
    blob.header.commitment = stowage::schema::make_bytes(source.commitment());
    blob.header.length_proof =
        stowage::schema::make_bytes(source.length_proof());
    blob.header.length = source.length();
    blob.header.account_id = source.account_id();
    for (const auto& quorum : source.quorum_headers()) {
      auto info = stowage::schema::blob_quorum_info_t{};
      auto status = from_proto(quorum, info);
      if (!stowage::schema::is_ok(status)) {
        return status;
      }
      blob.header.quorum_headers.push_back(info);
    }
    for (const auto& bundle : message.bundles()) {
      auto chunks = stowage::schema::bundle_t{};
      chunks.reserve(bundle.chunks_size());
      for (const auto& chunk : bundle.chunks()) {
        chunks.push_back(stowage::schema::make_bytes(chunk));
      }
      blob.bundles.push_back(std::move(chunks));
    }
    blobs.push_back(std::move(blob));
  }
  return stowage::schema::make_ok();
}

void to_proto(const stowage::schema::blob_header_t& header,
              stowage::node::BlobHeader* out) {
  out->set_commitment(stowage::schema::make_string(header.commitment));
  out->set_length_proof(stowage::schema::make_string(header.length_proof));
  out->set_length(header.length);
  out->set_account_id(header.account_id);
  for (const auto& quorum : header.quorum_headers) {
    auto* info = out->add_quorum_headers();
    info->set_quorum_id(quorum.quorum_id);
    info->set_adversary_threshold(quorum.adversary_threshold);
    info->set_quantization_factor(quorum.quantization_factor);
    info->set_encoded_blob_length(quorum.encoded_blob_length);
    info->set_quorum_threshold(quorum.quorum_threshold);
    info->set_ratelimit(quorum.ratelimit);
  }
}

void to_proto(const stowage::schema::merkle_proof_t& proof,
              stowage::node::MerkleProof* out) {
  for (const auto& hash : proof.hashes) {
    out->add_hashes(std::string{reinterpret_cast<const char*>(hash.data()),
                                hash.size()});
  }
  out->set_index(proof.index);
}

std::optional<stowage::schema::hash32_t> parse_batch_header_hash(
    const std::string& value) {
  return stowage::schema::try_make_hash32(
      stowage::schema::make_bytes_view(value));
}

grpc::StatusCode to_grpc_code(const stowage::schema::error_code code) {
  using enum stowage::schema::error_code;
  switch (code) {
    case ok:
      return grpc::StatusCode::OK;
    case validation:
    case commitment:
      return grpc::StatusCode::INVALID_ARGUMENT;
    case assignment:
      return grpc::StatusCode::FAILED_PRECONDITION;
    case not_found:
      return grpc::StatusCode::NOT_FOUND;
    case timeout:
      return grpc::StatusCode::DEADLINE_EXCEEDED;
    case storage:
      return grpc::StatusCode::UNAVAILABLE;
    case blob_index_out_of_range:
      return grpc::StatusCode::OUT_OF_RANGE;
    case signing:
      return grpc::StatusCode::INTERNAL;
    default:
      return grpc::StatusCode::UNKNOWN;
  }
}

grpc::Status to_grpc_status(const stowage::schema::status_t& status) {
  if (stowage::schema::is_ok(status)) {
    return grpc::Status::OK;
  }
  return grpc::Status{
      to_grpc_code(status.code),
      std::string{stowage::schema::error_code_name(status.code)} + ": " +
          status.log};
}

}  // namespace stowage::rpc
