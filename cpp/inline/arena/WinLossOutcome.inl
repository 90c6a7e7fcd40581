#include "arena/WinLossOutcome.hpp"

#include <magic_enum/magic_enum.hpp>

namespace arena {

inline WinLossOutcome WinLossOutcome::win(PlayerColor winner) {
  return WinLossOutcome{winner == PlayerColor::kBlack ? kBlackWins : kWhiteWins};
}

inline std::optional<PlayerColor> WinLossOutcome::winner() const {
  switch (kind) {
    case kBlackWins:
      return PlayerColor::kBlack;
    case kWhiteWins:
      return PlayerColor::kWhite;
    default:
      return std::nullopt;
  }
}

inline float WinLossOutcome::score(PlayerColor color) const {
  if (kind == kDraw) return 0.5;
  auto w = winner();
  return (w.has_value() && *w == color) ? 1 : 0;
}

inline std::string WinLossOutcome::to_str() const {
  // kBlackWins -> "BlackWins"
  return std::string(magic_enum::enum_name(kind).substr(1));
}

}  // namespace arena
