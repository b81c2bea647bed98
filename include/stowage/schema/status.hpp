#pragma once

#include <stowage/schema/error_code.hpp>
#include <cstdint>
#include <string>

// Schema type: status.
// Outcome of a node operation: a taxonomy code plus a human-readable log.
namespace stowage::schema {

template <uint16_t Version>
struct status;

template <>
struct status<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
};

using status_t = status<1>;

inline bool is_ok(const status_t& value) {
  return value.code == error_code::ok;
}

inline status_t make_ok() {
  return status_t{};
}

inline status_t make_error(const error_code code, std::string log) {
  return status_t{.code = code, .log = std::move(log)};
}

}  // namespace stowage::schema
