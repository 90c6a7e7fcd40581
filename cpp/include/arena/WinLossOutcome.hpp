#pragma once

#include "arena/BasicTypes.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace arena {

/*
 * A ready-made Outcome type for two-player games whose results are wins, draws, or a mutual loss
 * (both players overshoot some target, say).
 */
struct WinLossOutcome {
  enum Kind : int8_t { kBlackWins, kWhiteWins, kDraw, kBothLose };

  static WinLossOutcome win(PlayerColor winner);
  static WinLossOutcome draw() { return WinLossOutcome{kDraw}; }
  static WinLossOutcome both_lose() { return WinLossOutcome{kBothLose}; }

  auto operator<=>(const WinLossOutcome&) const = default;

  // Every kind is a terminal result.
  bool is_final() const { return true; }

  std::optional<PlayerColor> winner() const;

  // 1 for a win, 0.5 for a draw, 0 otherwise.
  float score(PlayerColor color) const;

  std::string to_str() const;

  Kind kind;
};

}  // namespace arena

#include "inline/arena/WinLossOutcome.inl"
