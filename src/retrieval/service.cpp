#include <spdlog/spdlog.h>
#include <stowage/retrieval/service.hpp>
#include <stowage/storage/retry.hpp>

#include <algorithm>
#include <string>

namespace stowage::retrieval {

namespace {

stowage::schema::status_t missing(
    const stowage::schema::hash32_t& batch_header_hash,
    const uint32_t blob_index,
    const uint32_t quorum_id,
    const std::string& reason) {
  spdlog::debug("Lookup miss for batch {} blob {} quorum {}: {}",
                stowage::schema::to_hex(batch_header_hash), blob_index,
                quorum_id, reason);
  return stowage::schema::make_error(stowage::schema::error_code::not_found,
                                     reason);
}

}  // namespace

service::service(const stowage::store::chunk_store& store,
                 const stowage::merkle::merkle_index& index,
                 const stowage::assignment::snapshot_registry& registry)
    : store_{store}, index_{index}, registry_{registry} {}

stowage::schema::status_t service::find_header(
    const stowage::schema::hash32_t& batch_header_hash,
    const uint32_t blob_index,
    const uint32_t quorum_id,
    stowage::schema::blob_header_t& header,
    const stowage::store::chunk_store::view_t& view) const {
  if (quorum_id > stowage::schema::kMaxQuorumId) {
    return missing(batch_header_hash, blob_index, quorum_id,
                   "quorum id out of range");
  }

  auto record = std::optional<stowage::schema::batch_record_t>{};
  auto status = stowage::storage::with_retry(
      store_.config().retry, "read batch record",
      [&]() { return store_.get_batch(batch_header_hash, record, &view); });
  if (!stowage::schema::is_ok(status)) {
    return status;
  }
  if (!record) {
    return missing(batch_header_hash, blob_index, quorum_id, "unknown batch");
  }
  if (stowage::store::chunk_store::is_expired(
          *record, registry_.current_block_number())) {
    return missing(batch_header_hash, blob_index, quorum_id,
                   "custody window elapsed");
  }
  if (blob_index >= record->blob_count) {
    return missing(batch_header_hash, blob_index, quorum_id,
                   "blob index beyond batch");
  }

  auto stored = std::optional<stowage::schema::blob_header_t>{};
  status = stowage::storage::with_retry(
      store_.config().retry, "read blob header", [&]() {
        return store_.get_blob_header(batch_header_hash, blob_index, stored,
                                      &view);
      });
  if (!stowage::schema::is_ok(status)) {
    return status;
  }
  if (!stored) {
    return missing(batch_header_hash, blob_index, quorum_id,
                   "blob header not stored");
  }
  auto in_blob = std::ranges::any_of(
      stored->quorum_headers,
      [&](const auto& quorum) { return quorum.quorum_id == quorum_id; });
  if (!in_blob) {
    return missing(batch_header_hash, blob_index, quorum_id,
                   "quorum is not part of the blob");
  }
  header = std::move(*stored);
  return stowage::schema::make_ok();
}

stowage::schema::chunks_result_t service::retrieve_chunks(
    const stowage::schema::hash32_t& batch_header_hash,
    const uint32_t blob_index,
    const uint32_t quorum_id) const {
  auto result = stowage::schema::chunks_result_t{};
  auto view = store_.view();
  auto header = stowage::schema::blob_header_t{};
  result.status =
      find_header(batch_header_hash, blob_index, quorum_id, header, view);
  if (!stowage::schema::is_ok(result.status)) {
    return result;
  }
  result.status = stowage::storage::with_retry(
      store_.config().retry, "read chunks", [&]() {
        return store_.get(batch_header_hash, blob_index,
                          static_cast<stowage::schema::quorum_id_t>(quorum_id),
                          result.chunks, &view);
      });
  if (result.status.code == stowage::schema::error_code::not_found) {
    result.status = missing(batch_header_hash, blob_index, quorum_id,
                            "no chunks held for this quorum");
  }
  return result;
}

stowage::schema::blob_header_result_t service::get_blob_header(
    const stowage::schema::hash32_t& batch_header_hash,
    const uint32_t blob_index,
    const uint32_t quorum_id) const {
  auto result = stowage::schema::blob_header_result_t{};
  auto view = store_.view();
  result.status = find_header(batch_header_hash, blob_index, quorum_id,
                              result.header, view);
  if (!stowage::schema::is_ok(result.status)) {
    return result;
  }
  result.status = stowage::storage::with_retry(
      store_.config().retry, "read inclusion proof", [&]() {
        return index_.get_proof(batch_header_hash, blob_index, result.proof,
                                &view);
      });
  if (result.status.code == stowage::schema::error_code::not_found) {
    result.status = missing(batch_header_hash, blob_index, quorum_id,
                            "merkle arena not stored");
  }
  return result;
}

}  // namespace stowage::retrieval
