#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace altyn::common {

/// Log a fatal fault, flush every sink and terminate the process.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format, Args&&... args) {
  spdlog::critical("{}", fmt::format(format, std::forward<Args>(args)...));
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace altyn::common
