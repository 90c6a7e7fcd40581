#pragma once

#include <string>
#include <vector>

namespace util {

// With the default sep, splits on runs of whitespace and drops empty pieces:
// split(" a \tb ") == {"a", "b"}. With a nonempty sep every occurrence splits, so
// split("a,,b", ",") == {"a", "", "b"}.
std::vector<std::string> split(const std::string& s, const char* sep = "");

// Splits on '\n'. A trailing newline does not add an empty last line.
std::vector<std::string> splitlines(const std::string& s);

// ASCII lowercase.
std::string to_lower(const std::string& s);

// {"a", "b", "c"}, "or" -> "a, b, or c". Without oxford_comma: "a, b or c".
std::string grammatically_join(const std::vector<std::string>& items,
                               const std::string& conjunction, bool oxford_comma = true);

}  // namespace util

#include "inline/util/StringUtil.inl"
