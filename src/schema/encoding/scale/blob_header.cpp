#include <stowage/schema/encoding/scale/blob_header.hpp>

#include <iterator>

namespace stowage::schema::encoding::scale {

blob_quorum_info_tuple_t to_tuple(const blob_quorum_info_t& o) {
  return blob_quorum_info_tuple_t{o.quorum_id,
                                  o.adversary_threshold,
                                  o.quantization_factor,
                                  o.encoded_blob_length,
                                  o.quorum_threshold,
                                  o.ratelimit};
}

blob_quorum_info_t from_tuple(const blob_quorum_info_tuple_t& t) {
  return blob_quorum_info_t{.quorum_id = std::get<0>(t),
                            .adversary_threshold = std::get<1>(t),
                            .quantization_factor = std::get<2>(t),
                            .encoded_blob_length = std::get<3>(t),
                            .quorum_threshold = std::get<4>(t),
                            .ratelimit = std::get<5>(t)};
}

blob_header_tuple_t to_tuple(const blob_header_t& o) {
  auto quorums = std::vector<blob_quorum_info_tuple_t>{};
  quorums.reserve(o.quorum_headers.size());
  for (const auto& quorum : o.quorum_headers) {
    quorums.push_back(to_tuple(quorum));
  }
  return blob_header_tuple_t{o.commitment, o.length_proof, o.length,
                             std::move(quorums), o.account_id};
}

blob_header_t from_tuple(const blob_header_tuple_t& t) {
  auto header = blob_header_t{};
  header.commitment = std::get<0>(t);
  header.length_proof = std::get<1>(t);
  header.length = std::get<2>(t);
  for (const auto& quorum : std::get<3>(t)) {
    header.quorum_headers.push_back(from_tuple(quorum));
  }
  header.account_id = std::get<4>(t);
  return header;
}

}  // namespace stowage::schema::encoding::scale
