#pragma once

#include <stowage/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: error code.
// Node failure taxonomy shared by the dispersal and retrieval paths.
namespace stowage::schema {

enum class error_code : uint32_t {
  ok = 0,
  validation = 1,
  assignment = 2,
  commitment = 3,
  not_found = 4,
  timeout = 5,
  storage = 6,
  blob_index_out_of_range = 7,
  signing = 8,
};

inline constexpr auto kErrorCodeNames =
    std::array<std::pair<std::string_view, error_code>, 9>{{
        {"ok", error_code::ok},
        {"validation_error", error_code::validation},
        {"assignment_error", error_code::assignment},
        {"commitment_error", error_code::commitment},
        {"not_found", error_code::not_found},
        {"timeout", error_code::timeout},
        {"storage_error", error_code::storage},
        {"blob_index_out_of_range", error_code::blob_index_out_of_range},
        {"signing_error", error_code::signing},
    }};

constexpr std::string_view error_code_name(const error_code code) {
  return to_string(code, kErrorCodeNames).value_or("unknown");
}

}  // namespace stowage::schema
