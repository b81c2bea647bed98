#include <stowage/commitment/commitment_verifier.hpp>

#include <bit>
#include <string>

namespace stowage::commitment {

namespace {

stowage::schema::status_t fail(std::string log) {
  return stowage::schema::make_error(stowage::schema::error_code::commitment,
                                     std::move(log));
}

}  // namespace

std::optional<uint32_t> chunk_length(
    const stowage::schema::blob_quorum_info_t& quorum,
    const uint32_t total_chunks) {
  if (total_chunks == 0 || quorum.encoded_blob_length % total_chunks != 0) {
    return std::nullopt;
  }
  auto length = quorum.encoded_blob_length / total_chunks;
  if (length == 0 || !std::has_single_bit(length)) {
    return std::nullopt;
  }
  return length;
}

uint64_t min_encoded_length(const stowage::schema::blob_quorum_info_t& quorum,
                            const uint32_t length) {
  auto gap = static_cast<uint64_t>(quorum.quorum_threshold) -
             static_cast<uint64_t>(quorum.adversary_threshold);
  auto numerator = static_cast<uint64_t>(length) * 100;
  return (numerator + gap - 1) / gap;
}

commitment_verifier::commitment_verifier(
    std::shared_ptr<const pairing_backend> backend)
    : backend_{std::move(backend)} {}

stowage::schema::status_t commitment_verifier::verify_blob(
    const stowage::schema::blob_t& blob,
    const std::vector<assigned_bundle>& assigned) const {
  const auto& header = blob.header;
  auto commitment = stowage::schema::make_bytes_view(header.commitment);

  for (const auto& entry : assigned) {
    const auto& quorum = header.quorum_headers[entry.quorum_position];
    const auto& bundle = blob.bundles[entry.quorum_position];

    // Validated upstream: quorum_threshold >= adversary_threshold + 10.
    if (quorum.encoded_blob_length <
        min_encoded_length(quorum, header.length)) {
      return fail("quorum " + std::to_string(quorum.quorum_id) +
                  ": encoded length " +
                  std::to_string(quorum.encoded_blob_length) +
                  " too short for blob length " +
                  std::to_string(header.length));
    }

    auto length = chunk_length(quorum, entry.assignment.total_chunks);
    if (!length) {
      return fail("quorum " + std::to_string(quorum.quorum_id) +
                  ": invalid chunk length for encoded length " +
                  std::to_string(quorum.encoded_blob_length) + " over " +
                  std::to_string(entry.assignment.total_chunks) + " chunks");
    }

    auto expected_size = frame_size(*length);
    for (std::size_t i = 0; i < bundle.size(); ++i) {
      if (bundle[i].size() != expected_size) {
        return fail("quorum " + std::to_string(quorum.quorum_id) + ": chunk " +
                    std::to_string(i) + " has " +
                    std::to_string(bundle[i].size()) + " bytes, expected " +
                    std::to_string(expected_size));
      }
    }

    if (!backend_->verify_frames(commitment, bundle,
                                 entry.assignment.start_index, *length,
                                 entry.assignment.total_chunks)) {
      return fail("quorum " + std::to_string(quorum.quorum_id) +
                  ": chunks do not open the commitment");
    }
  }

  if (!backend_->verify_length(
          commitment, stowage::schema::make_bytes_view(header.length_proof),
          header.length)) {
    return fail("length proof does not bound the commitment");
  }
  return stowage::schema::make_ok();
}

}  // namespace stowage::commitment
