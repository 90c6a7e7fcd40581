#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

namespace util {

// Base exception of the project. The constructor takes an fmt format string and its arguments.
class Exception : public std::exception {
 public:
  Exception() : std::exception() {}

  template <typename... Ts>
  Exception(fmt::format_string<Ts...> fmt, Ts&&... ts) : std::exception() {
    what_ = fmt::format(fmt, std::forward<Ts>(ts)...);
  }
  char const* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

// An error caused by the user rather than by the program, such as a bad --agent string. main()
// prints its message to stderr and exits with status 1 instead of letting it terminate the process.
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// Thrown by DEBUG_ASSERT().
class DebugAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "DEBUG_ASSERT"; }
  using Exception::Exception;
};

// Thrown by RELEASE_ASSERT().
class ReleaseAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "RELEASE_ASSERT"; }
  using Exception::Exception;
};

// Thrown by CLEAN_ASSERT().
class CleanAssertionError : public CleanException {
 public:
  static constexpr const char* descr() { return "CLEAN_ASSERT"; }
  using CleanException::CleanException;
};

}  // namespace util
