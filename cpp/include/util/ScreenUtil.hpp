#pragma once

namespace util {

// Terminal width in columns. Falls back to 80 when stdout is not a terminal.
inline int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
