#include <stowage/assignment/snapshot_registry.hpp>

#include <iterator>
#include <mutex>

namespace stowage::assignment {

void snapshot_registry::publish(stowage::schema::operator_state_t state) {
  auto block_number = state.block_number;
  auto snapshot = std::make_shared<const stowage::schema::operator_state_t>(
      std::move(state));
  auto lock = std::unique_lock{mutex_};
  snapshots_[block_number] = std::move(snapshot);
}

void snapshot_registry::replace(
    std::vector<stowage::schema::operator_state_t> states,
    const stowage::schema::block_number_t current_block_number) {
  auto next = std::map<stowage::schema::block_number_t, snapshot_ptr>{};
  for (auto& state : states) {
    auto block_number = state.block_number;
    next[block_number] =
        std::make_shared<const stowage::schema::operator_state_t>(
            std::move(state));
  }
  auto lock = std::unique_lock{mutex_};
  snapshots_ = std::move(next);
  current_block_number_ = current_block_number;
}

snapshot_registry::snapshot_ptr snapshot_registry::at(
    const stowage::schema::block_number_t reference_block_number) const {
  auto lock = std::shared_lock{mutex_};
  auto it = snapshots_.upper_bound(reference_block_number);
  if (it == std::begin(snapshots_)) {
    return nullptr;
  }
  return std::prev(it)->second;
}

std::size_t snapshot_registry::size() const {
  auto lock = std::shared_lock{mutex_};
  return snapshots_.size();
}

void snapshot_registry::set_current_block_number(
    const stowage::schema::block_number_t block_number) {
  current_block_number_ = block_number;
}

stowage::schema::block_number_t snapshot_registry::current_block_number()
    const {
  return current_block_number_;
}

}  // namespace stowage::assignment
