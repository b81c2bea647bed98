#pragma once
#include <stowage/assignment/snapshot_registry.hpp>
#include <stowage/store/chunk_store.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace stowage::store {

/// Background pass deleting batches whose custody window has elapsed.
class expiry_worker final {
 public:
  expiry_worker(const chunk_store& store,
                const stowage::assignment::snapshot_registry& registry,
                std::chrono::seconds interval);
  ~expiry_worker();

  expiry_worker(const expiry_worker&) = delete;
  expiry_worker& operator=(const expiry_worker&) = delete;

  void start();
  void stop();

  /// One pass at the registry's current chain height; returns the number of
  /// batches removed.
  std::size_t run_once();

 private:
  void loop();

  const chunk_store& store_;
  const stowage::assignment::snapshot_registry& registry_;
  std::chrono::seconds interval_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace stowage::store
