#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace schemata::common {

// Unrecoverable programmer error: logs, flushes the sinks and terminates.
// Authoring errors never come through here, they travel as build_result.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  spdlog::critical("{}", fmt::format(format, std::forward<Args>(args)...));
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace schemata::common
