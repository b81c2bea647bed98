#pragma once
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace stowage::storage {

using key_value_entry_t =
    std::pair<stowage::schema::bytes_t, stowage::schema::bytes_t>;

/// Set of puts and deletes applied atomically by `storage::write`.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<stowage::schema::bytes_t> deletes;
};

/// Consistent point-in-time view used to group reads. Backends specialize it.
template <typename Library>
struct read_view;

template <typename Library>
struct storage {
  /// Open a point-in-time view; released when the view is destroyed.
  read_view<Library> view() const;

  /// Read raw value at key into `value` (std::nullopt when missing).
  stowage::schema::status_t read(
      const stowage::schema::bytes_view_t& key,
      std::optional<stowage::schema::bytes_t>& value,
      const read_view<Library>* view = nullptr) const;

  /// Read and decode value at key; a value that fails to decode is a
  /// storage error.
  template <typename Encoder, typename T>
  stowage::schema::status_t read(Encoder& encoder,
                                 const stowage::schema::bytes_view_t& key,
                                 std::optional<T>& value,
                                 const read_view<Library>* view = nullptr) const;

  /// Apply every put and delete of `batch` in one durable (synced) write.
  stowage::schema::status_t write(const write_batch& batch) const;

  /// Visit entries under prefix in key order until the visitor returns false.
  template <typename Visitor>
  stowage::schema::status_t scan_prefix(
      const stowage::schema::bytes_view_t& prefix,
      Visitor&& visitor,
      const read_view<Library>* view = nullptr) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace stowage::storage
