#include <spdlog/spdlog.h>
#include <stowage/store/expiry_worker.hpp>

namespace stowage::store {

expiry_worker::expiry_worker(
    const chunk_store& store,
    const stowage::assignment::snapshot_registry& registry,
    const std::chrono::seconds interval)
    : store_{store}, registry_{registry}, interval_{interval} {}

expiry_worker::~expiry_worker() {
  stop();
}

void expiry_worker::start() {
  auto lock = std::unique_lock{mutex_};
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread{[this] { loop(); }};
}

void expiry_worker::stop() {
  {
    auto lock = std::unique_lock{mutex_};
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::size_t expiry_worker::run_once() {
  auto current = registry_.current_block_number();
  auto expired = std::size_t{0};
  auto status = store_.expire(current, expired);
  if (!stowage::schema::is_ok(status)) {
    spdlog::error("Expiry pass at block {} stopped after {} batch(es): {}",
                  current, expired, status.log);
  } else if (expired > 0) {
    spdlog::info("Expired {} batch(es) at block {}", expired, current);
  }
  return expired;
}

void expiry_worker::loop() {
  spdlog::info("Expiry worker running every {}s", interval_.count());
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    lock.unlock();
    run_once();
    lock.lock();
    wake_.wait_for(lock, interval_, [this] { return stopping_; });
  }
  spdlog::info("Expiry worker stopped");
}

}  // namespace stowage::store
