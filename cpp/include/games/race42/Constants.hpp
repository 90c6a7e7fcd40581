#pragma once

#include <array>

namespace race42 {

const int kTarget = 42;

// in the order returned by legal_actions()
constexpr std::array<int, 3> kBumps = {2, 3, 4};

}  // namespace race42
