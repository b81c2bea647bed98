#pragma once
#include <stowage/schema/primitives.hpp>
#include <optional>
#include <span>

namespace stowage::schema::encoding {

// Encoding backend is a build time choice selected by tag, the same way
// storage backends are. Only SCALE is provided.
template <typename Library>
struct encoder {
  template <typename T>
  stowage::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, stowage::schema::bytes_t& out);

  template <typename T>
  T decode(const stowage::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const stowage::schema::bytes_view_t& bytes);
};

}  // namespace stowage::schema::encoding
