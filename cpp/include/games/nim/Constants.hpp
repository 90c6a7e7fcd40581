#pragma once

namespace nim {

const int kMaxStonesToTake = 3;
const int kStartingStones = 21;

}  // namespace nim
