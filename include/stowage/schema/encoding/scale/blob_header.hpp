#pragma once
#include <stowage/schema/blob_header.hpp>
#include <stowage/schema/blob_quorum_info.hpp>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace stowage::schema::encoding::scale {

using blob_quorum_info_tuple_t =
    std::tuple<uint8_t, uint8_t, uint32_t, uint32_t, uint8_t, uint32_t>;

using blob_header_tuple_t =
    std::tuple<bytes_t,
               bytes_t,
               uint32_t,
               std::vector<blob_quorum_info_tuple_t>,
               std::string>;

blob_quorum_info_tuple_t to_tuple(const blob_quorum_info_t& o);
blob_quorum_info_t from_tuple(const blob_quorum_info_tuple_t& t);

blob_header_tuple_t to_tuple(const blob_header_t& o);
blob_header_t from_tuple(const blob_header_tuple_t& t);

}  // namespace stowage::schema::encoding::scale
