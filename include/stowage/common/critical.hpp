#pragma once

#include <cstdlib>
#include <string_view>

#include <spdlog/spdlog.h>
#include <stowage/schema/error_code.hpp>
#include <stowage/schema/status.hpp>

namespace stowage::common {

/// Process exit code of a node stopped by `critical` (EX_SOFTWARE).
inline constexpr auto kCriticalExitCode = 70;

/// Log, flush every sink and exit. Reserved for conditions the node cannot
/// serve through (database cannot be opened, signing key unreadable). The
/// SIGTERM handler only requests a drain, so this exits directly.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("Stopping node: {}", message);
  spdlog::shutdown();
  std::_Exit(kCriticalExitCode);
}

/// As above, with the failed operation's status appended.
[[noreturn]] inline void critical(const std::string_view message,
                                  const stowage::schema::status_t& status) {
  spdlog::critical("Stopping node: {} [{}] {}", message,
                   stowage::schema::error_code_name(status.code), status.log);
  spdlog::shutdown();
  std::_Exit(kCriticalExitCode);
}

}  // namespace stowage::common
