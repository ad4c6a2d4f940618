#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

// Unrecoverable faults: storage corruption, a broken crypto backend, invalid
// operator input to the tools. Logs, flushes every logger and stops the
// process.
namespace quorum::common {

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Arg>(arg), std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace quorum::common
