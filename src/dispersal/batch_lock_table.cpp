#include <stowage/dispersal/batch_lock_table.hpp>

namespace stowage::dispersal {

batch_lock_table::guard::guard(batch_lock_table* table,
                               const stowage::schema::hash32_t& key,
                               std::shared_ptr<entry> held)
    : table_{table}, key_{key}, held_{std::move(held)} {}

batch_lock_table::guard::guard(guard&& other) noexcept
    : table_{other.table_}, key_{other.key_}, held_{std::move(other.held_)} {
  other.table_ = nullptr;
}

batch_lock_table::guard::~guard() {
  if (table_ == nullptr || !held_) {
    return;
  }
  held_->mutex.unlock();
  table_->release(key_);
}

std::optional<batch_lock_table::guard> batch_lock_table::lock_until(
    const stowage::schema::hash32_t& key,
    const clock_type::time_point deadline) {
  auto held = std::shared_ptr<entry>{};
  {
    auto lock = std::lock_guard{mutex_};
    auto& slot = entries_[key];
    if (!slot) {
      slot = std::make_shared<entry>();
    }
    ++slot->users;
    held = slot;
  }
  if (!held->mutex.try_lock_until(deadline)) {
    release(key);
    return std::nullopt;
  }
  return guard{this, key, std::move(held)};
}

std::size_t batch_lock_table::size() const {
  auto lock = std::lock_guard{mutex_};
  return entries_.size();
}

void batch_lock_table::release(const stowage::schema::hash32_t& key) {
  auto lock = std::lock_guard{mutex_};
  auto it = entries_.find(key);
  if (it == std::end(entries_)) {
    return;
  }
  if (--it->second->users == 0) {
    entries_.erase(it);
  }
}

}  // namespace stowage::dispersal
