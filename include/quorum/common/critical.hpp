#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace quorum::common {

/// Log an unrecoverable fault, flush every sink and stop the process.
///
/// Reserved for infrastructure faults (storage I/O, undecodable persisted
/// rows). Wallet rule violations are reported through operation results.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  auto message = fmt::format(format, std::forward<Args>(args)...);
  critical(std::string_view{message});
}

}  // namespace quorum::common
