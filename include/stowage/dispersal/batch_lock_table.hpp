#pragma once
#include <stowage/schema/primitives.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace stowage::dispersal {

/// Timed mutual exclusion keyed by batch_header_hash. Entries exist only
/// while some caller holds or waits on them.
class batch_lock_table final {
  struct entry final {
    std::timed_mutex mutex;
    std::size_t users{};
  };

 public:
  using clock_type = std::chrono::steady_clock;

  /// Held lock; released on destruction.
  class guard final {
   public:
    guard(guard&& other) noexcept;
    guard& operator=(guard&&) = delete;
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    ~guard();

   private:
    friend class batch_lock_table;
    guard(batch_lock_table* table,
          const stowage::schema::hash32_t& key,
          std::shared_ptr<entry> held);

    batch_lock_table* table_{nullptr};
    stowage::schema::hash32_t key_{};
    std::shared_ptr<entry> held_;
  };

  /// Lock `key`, waiting until `deadline` at most. std::nullopt on timeout.
  std::optional<guard> lock_until(const stowage::schema::hash32_t& key,
                                  clock_type::time_point deadline);

  /// Keys currently held or awaited.
  std::size_t size() const;

 private:
  void release(const stowage::schema::hash32_t& key);

  mutable std::mutex mutex_;
  std::map<stowage::schema::hash32_t, std::shared_ptr<entry>> entries_;
};

}  // namespace stowage::dispersal
