#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace chronicle::common {

/// Log at critical level, flush every sink, then raise SIGTERM and terminate.
/// Only used for misconfiguration or storage failures at startup; runtime
/// failures are reported through result codes instead.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace chronicle::common
