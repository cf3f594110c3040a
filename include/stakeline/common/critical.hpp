#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace stakeline::common {

/// Log at critical level, flush every sink and terminate the process.
///
/// Reserved for faults the engine cannot roll back from: storage I/O errors,
/// corrupt persisted rows and invalid startup configuration. Domain failures
/// are reported through `schema::operation_result_t` instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace stakeline::common
