#pragma once
#include <stowage/schema/operator_state.hpp>
#include <stowage/schema/primitives.hpp>
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace stowage::assignment {

/// Versioned, read-mostly view of operator state and chain height.
///
/// Snapshots are immutable once published. A store call captures one
/// `snapshot_ptr` up front and keeps using it, so a refresh landing mid-call
/// cannot change the assignment the call validates against.
class snapshot_registry final {
 public:
  using snapshot_ptr = std::shared_ptr<const stowage::schema::operator_state_t>;

  /// Add (or replace) the snapshot effective from `state.block_number`.
  void publish(stowage::schema::operator_state_t state);

  /// Swap in a complete set of snapshots and the chain height in one step.
  void replace(std::vector<stowage::schema::operator_state_t> states,
               stowage::schema::block_number_t current_block_number);

  /// Snapshot with the greatest block number <= `reference_block_number`.
  snapshot_ptr at(stowage::schema::block_number_t reference_block_number) const;

  std::size_t size() const;

  void set_current_block_number(stowage::schema::block_number_t block_number);
  stowage::schema::block_number_t current_block_number() const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<stowage::schema::block_number_t, snapshot_ptr> snapshots_;
  std::atomic<stowage::schema::block_number_t> current_block_number_{0};
};

}  // namespace stowage::assignment
