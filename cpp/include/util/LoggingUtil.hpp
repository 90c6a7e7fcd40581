#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/spdlog.h>

#include <string>

// Logging goes through spdlog's default logger, with fmt-style format strings:
//
//   LOG_INFO("Game {} won by {}", game_id, name);
//
// Statements below SPDLOG_ACTIVE_LEVEL are removed at compile time, arguments included. The
// TURNARENA_DEBUG_LOGGING cmake option keeps LOG_DEBUG().
#define TURNARENA_LOG(spdlog_macro, ...) \
  do {                                   \
    USE_UNEVALUATED(__VA_ARGS__);        \
    spdlog_macro(__VA_ARGS__);           \
  } while (0)

#define LOG_DEBUG(...) TURNARENA_LOG(SPDLOG_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) TURNARENA_LOG(SPDLOG_INFO, __VA_ARGS__)
#define LOG_WARN(...) TURNARENA_LOG(SPDLOG_WARN, __VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  // Replaces spdlog's default logger with one writing to stdout, and to log_filename if set.
  static void init(const Params&);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
