#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace arena {

using seat_index_t = int8_t;
using game_id_t = int64_t;
using turn_count_t = int32_t;

constexpr int kNumPlayers = 2;
constexpr int kMaxNameLength = 32;  // agent names

// Only two seats ever exist. The ordering (kBlack < kWhite) is used for comparison only; it does
// not dictate who moves first, which is up to each game's start State.
enum class PlayerColor : int8_t { kBlack, kWhite };

constexpr PlayerColor opponent(PlayerColor color) {
  return color == PlayerColor::kBlack ? PlayerColor::kWhite : PlayerColor::kBlack;
}

constexpr seat_index_t to_seat(PlayerColor color) { return static_cast<seat_index_t>(color); }

// Throws util::Exception for seats outside [0, kNumPlayers).
inline PlayerColor from_seat(int seat);

// "Black" / "White"
inline std::string_view color_name(PlayerColor color);

// Case-insensitive inverse of color_name(). Throws util::CleanException on failure, since the
// input typically comes from the command line.
inline PlayerColor parse_color(const std::string& str);

}  // namespace arena

template <>
struct fmt::formatter<arena::PlayerColor> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(arena::PlayerColor color, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(arena::color_name(color), ctx);
  }
};

#include "inline/arena/BasicTypes.inl"
