#pragma once

#include <stowage/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace stowage::testing {

inline stowage::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = stowage::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline stowage::schema::operator_id_t make_operator_id(const uint8_t seed) {
  auto id = stowage::schema::operator_id_t{};
  id[0] = seed;
  id[31] = 0xA5;
  return id;
}

inline stowage::schema::bytes_t make_filled(const std::size_t size,
                                            const uint8_t seed) {
  auto out = stowage::schema::bytes_t(size);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i * 7));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace stowage::testing
