#pragma once

#include "arena/BasicTypes.hpp"

#include <concepts>

namespace arena {
namespace concepts {

/*
 * An Outcome describes how a finished game ended.
 *
 * is_final() reports whether this particular value is a true terminal result. GameRunner does not
 * consult it to decide termination; the presence of a value in State::outcome() is the only
 * termination signal.
 */
template <class O>
concept Outcome = std::copyable<O> && requires(const O& outcome) {
  { outcome.is_final() } -> std::same_as<bool>;
};

/*
 * An Outcome that can be scored per color (1 = win, 0 = loss, anything in between for draws).
 * GameServer needs this to aggregate results over many games.
 */
template <class O>
concept ScoredOutcome = Outcome<O> && requires(const O& outcome, arena::PlayerColor color) {
  { outcome.score(color) } -> std::same_as<float>;
};

}  // namespace concepts
}  // namespace arena
