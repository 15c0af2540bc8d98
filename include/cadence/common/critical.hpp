#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cadence::common {

/// Log an unrecoverable condition and bring the process down.
///
/// Reserved for broken storage/encoding invariants; ledger-level failures are
/// reported through result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace cadence::common
