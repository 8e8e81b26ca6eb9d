#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace vellum::common {

/// Abort on a broken internal invariant (an OpenSSL allocation failure, an
/// encoder fed a value it built itself). User input never reaches this path;
/// it is reported through `vellum::common::error` instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace vellum::common
