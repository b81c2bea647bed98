#pragma once
#include <spdlog/spdlog.h>
#include <stowage/schema/status.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>

namespace stowage::storage {

/// Bounded exponential backoff for backend operations.
struct retry_policy final {
  uint32_t attempts{3};
  std::chrono::milliseconds initial_backoff{10};
  std::chrono::milliseconds max_backoff{200};
};

/// Run `operation` until it succeeds or `policy.attempts` are used up. Only
/// storage errors are retried; any other code is returned immediately.
template <typename Operation>
stowage::schema::status_t with_retry(const retry_policy& policy,
                                     const std::string_view name,
                                     Operation&& operation) {
  auto backoff = policy.initial_backoff;
  auto attempts = std::max<uint32_t>(policy.attempts, 1);
  auto result = stowage::schema::status_t{};
  for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    result = operation();
    if (result.code != stowage::schema::error_code::storage) {
      return result;
    }
    if (attempt == attempts) {
      break;
    }
    spdlog::warn("Storage operation '{}' failed (attempt {}/{}): {}", name,
                 attempt, attempts, result.log);
    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, policy.max_backoff);
  }
  spdlog::error("Storage operation '{}' failed after {} attempt(s): {}", name,
                attempts, result.log);
  return result;
}

}  // namespace stowage::storage
