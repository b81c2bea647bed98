#include <stowage/assignment/resolver.hpp>
#include <stowage/merkle/merkle_index.hpp>
#include <stowage/schema/hash.hpp>
#include <stowage/validation/batch_validator.hpp>

#include <set>
#include <string>

namespace stowage::validation {

namespace {

stowage::schema::status_t invalid(std::string log) {
  return stowage::schema::make_error(stowage::schema::error_code::validation,
                                     std::move(log));
}

stowage::schema::status_t unassigned(std::string log) {
  return stowage::schema::make_error(stowage::schema::error_code::assignment,
                                     std::move(log));
}

std::string blob_prefix(const std::size_t blob_index) {
  return "blob " + std::to_string(blob_index) + ": ";
}

stowage::schema::status_t check_blob_shape(
    const std::size_t blob_index,
    const stowage::schema::blob_t& blob) {
  const auto& header = blob.header;
  if (header.quorum_headers.empty()) {
    return invalid(blob_prefix(blob_index) + "no quorum headers");
  }
  if (blob.bundles.size() != header.quorum_headers.size()) {
    return invalid(blob_prefix(blob_index) + "has " +
                   std::to_string(blob.bundles.size()) + " bundles for " +
                   std::to_string(header.quorum_headers.size()) +
                   " quorum headers");
  }
  if (header.commitment.size() != stowage::schema::kCommitmentSize) {
    return invalid(blob_prefix(blob_index) + "commitment must be " +
                   std::to_string(stowage::schema::kCommitmentSize) +
                   " bytes");
  }
  if (header.length_proof.size() != stowage::schema::kLengthProofSize) {
    return invalid(blob_prefix(blob_index) + "length proof must be " +
                   std::to_string(stowage::schema::kLengthProofSize) +
                   " bytes");
  }
  if (header.length == 0) {
    return invalid(blob_prefix(blob_index) + "zero length");
  }

  auto seen = std::set<stowage::schema::quorum_id_t>{};
  for (std::size_t q = 0; q < header.quorum_headers.size(); ++q) {
    const auto& quorum = header.quorum_headers[q];
    if (!seen.insert(quorum.quorum_id).second) {
      return invalid(blob_prefix(blob_index) + "duplicate quorum " +
                     std::to_string(quorum.quorum_id));
    }
    if (quorum.adversary_threshold == 0) {
      return invalid(blob_prefix(blob_index) + "quorum " +
                     std::to_string(quorum.quorum_id) +
                     " adversary threshold must be positive");
    }
    if (quorum.quorum_threshold > 100) {
      return invalid(blob_prefix(blob_index) + "quorum " +
                     std::to_string(quorum.quorum_id) +
                     " quorum threshold exceeds 100");
    }
    if (quorum.quorum_threshold < quorum.adversary_threshold + 10) {
      return invalid(blob_prefix(blob_index) + "quorum " +
                     std::to_string(quorum.quorum_id) +
                     " quorum threshold must exceed adversary threshold by "
                     "at least 10");
    }
    if (quorum.quantization_factor == 0) {
      return invalid(blob_prefix(blob_index) + "quorum " +
                     std::to_string(quorum.quorum_id) +
                     " quantization factor must be positive");
    }
    const auto& bundle = blob.bundles[q];
    for (const auto& chunk : bundle) {
      if (chunk.size() != bundle.front().size()) {
        return invalid(blob_prefix(blob_index) + "quorum " +
                       std::to_string(quorum.quorum_id) +
                       " chunks differ in length");
      }
    }
  }
  return stowage::schema::make_ok();
}

}  // namespace

batch_validator::batch_validator(validator_config config)
    : config_{std::move(config)} {}

const validator_config& batch_validator::config() const {
  return config_;
}

stowage::schema::status_t batch_validator::validate(
    const stowage::schema::batch_header_t& header,
    const std::vector<stowage::schema::blob_t>& blobs,
    const stowage::schema::operator_state_t& state,
    const stowage::schema::block_number_t current_block_number,
    batch_plan& plan) const {
  plan = batch_plan{};

  if (header.reference_block_number == 0) {
    return invalid("reference block number must be non-zero");
  }
  if (blobs.empty()) {
    return invalid("batch has no blobs");
  }
  for (std::size_t i = 0; i < blobs.size(); ++i) {
    auto status = check_blob_shape(i, blobs[i]);
    if (!stowage::schema::is_ok(status)) {
      return status;
    }
  }

  auto reference = header.reference_block_number;
  if (current_block_number > config_.max_reference_lag &&
      reference < current_block_number - config_.max_reference_lag) {
    return invalid("reference block " + std::to_string(reference) +
                   " is too far behind chain height " +
                   std::to_string(current_block_number));
  }
  if (reference > current_block_number + config_.max_reference_lead) {
    return invalid("reference block " + std::to_string(reference) +
                   " is ahead of chain height " +
                   std::to_string(current_block_number));
  }
  if (reference + config_.custody_blocks < current_block_number) {
    return invalid("custody window of reference block " +
                   std::to_string(reference) + " ended at block " +
                   std::to_string(reference + config_.custody_blocks) +
                   ", chain height is " +
                   std::to_string(current_block_number));
  }

  auto headers = std::vector<stowage::schema::blob_header_t>{};
  headers.reserve(blobs.size());
  for (const auto& blob : blobs) {
    headers.push_back(blob.header);
  }
  auto tree = stowage::merkle::merkle_index::build(headers);
  if (tree.root() != header.batch_root) {
    return invalid("batch root does not match blob headers");
  }

  auto assigned = std::vector<std::vector<stowage::commitment::assigned_bundle>>(
      blobs.size());
  for (std::size_t i = 0; i < blobs.size(); ++i) {
    const auto& blob = blobs[i];
    for (std::size_t q = 0; q < blob.header.quorum_headers.size(); ++q) {
      const auto& quorum = blob.header.quorum_headers[q];
      const auto& bundle = blob.bundles[q];
      auto assignment = stowage::assignment::resolve(
          state, quorum.quorum_id, quorum.quantization_factor);
      if (!assignment) {
        if (!bundle.empty()) {
          return unassigned(blob_prefix(i) + "carries chunks for quorum " +
                            std::to_string(quorum.quorum_id) +
                            " which is not assigned to this node");
        }
        continue;
      }
      if (bundle.size() != assignment->num_chunks) {
        return invalid(blob_prefix(i) + "quorum " +
                       std::to_string(quorum.quorum_id) + " carries " +
                       std::to_string(bundle.size()) + " chunks, expected " +
                       std::to_string(assignment->num_chunks));
      }
      assigned[i].push_back(stowage::commitment::assigned_bundle{
          .quorum_position = q, .assignment = *assignment});
    }
    if (assigned[i].empty() &&
        config_.rejection_policy == blob_rejection_policy::whole_batch) {
      return unassigned(blob_prefix(i) +
                        "none of its quorums assign chunks to this node");
    }
  }

  plan.batch_header_hash = stowage::schema::hash_batch_header(header);
  plan.assigned = std::move(assigned);
  plan.tree = std::move(tree);
  return stowage::schema::make_ok();
}

}  // namespace stowage::validation
