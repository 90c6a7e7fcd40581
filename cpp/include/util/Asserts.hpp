#pragma once

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>

#include <source_location>
#include <utility>

#ifndef DEBUG_BUILD
#define DEBUG_BUILD 0
#endif

/*
 * Assert macros. Each takes a condition, optionally followed by an fmt format string and its
 * arguments, and throws a typed error when the condition is false:
 *
 * - DEBUG_ASSERT(): util::DebugAssertionError. Checked only when DEBUG_BUILD=1 (the cmake Debug
 *   config); otherwise the condition and arguments are compiled but never evaluated.
 *
 * - RELEASE_ASSERT(): util::ReleaseAssertionError. Always checked. Used for broken invariants.
 *
 * - CLEAN_ASSERT(): util::CleanAssertionError, a util::CleanException. Always checked. Used for
 *   bad user input.
 *
 * Whenever a check runs, the format arguments are evaluated too, pass or fail. Hot paths with
 * costly messages should test the condition themselves and throw only on failure.
 */

#define DEBUG_ASSERT(COND, ...)                                                                  \
  do {                                                                                           \
    if (IS_MACRO_ENABLED(DEBUG_BUILD)) {                                                         \
      util::detail::assert_impl<util::DebugAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                 \
    }                                                                                            \
  } while (0)

#define RELEASE_ASSERT(COND, ...)                                                                  \
  do {                                                                                             \
    util::detail::assert_impl<util::ReleaseAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
  } while (0)

#define CLEAN_ASSERT(COND, ...)                                                                  \
  do {                                                                                           \
    util::detail::assert_impl<util::CleanAssertionError>(#COND, std::source_location::current(), \
                                                         COND, ##__VA_ARGS__);                   \
  } while (0)

namespace util {
namespace detail {

template <typename ExceptionT, typename... Ts>
inline void assert_impl(const char*, const std::source_location& loc, bool cond,
                        fmt::format_string<Ts...> fmt, Ts&&... ts) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(),
                     fmt::format(fmt, std::forward<Ts>(ts)...), loc.file_name(), loc.line());
  }
}

template <typename ExceptionT>
inline void assert_impl(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(), cond_str, loc.file_name(),
                     loc.line());
  }
}

}  // namespace detail
}  // namespace util
