#pragma once

#include "arena/BasicTypes.hpp"

#include <concepts>
#include <optional>
#include <vector>

namespace arena {
namespace concepts {

/*
 * A State is a complete, self-contained, copyable game position.
 *
 * - make_next(action) advances the state in place. The action must be one that legal_actions()
 *   currently enumerates. What happens otherwise is up to the game.
 *
 * - next(action) returns the state that make_next(action) would produce, leaving the receiver
 *   unchanged. arena::StateBase provides it for free.
 *
 * - legal_actions() must be non-empty whenever outcome() is empty.
 *
 * - current_player_turn() is defined even for terminal states.
 *
 * - outcome() returns a value exactly when the game is over.
 */
template <class S, class A, class O>
concept State = std::copyable<S> && requires(S& state, const S& const_state, A action) {
  { state.make_next(action) };
  { const_state.next(action) } -> std::same_as<S>;
  { const_state.legal_actions() } -> std::same_as<std::vector<A>>;
  { const_state.current_player_turn() } -> std::same_as<arena::PlayerColor>;
  { const_state.outcome() } -> std::same_as<std::optional<O>>;
};

}  // namespace concepts
}  // namespace arena
