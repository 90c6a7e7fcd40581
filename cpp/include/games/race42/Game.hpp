#pragma once

#include "arena/BasicTypes.hpp"
#include "arena/IOBase.hpp"
#include "arena/StateBase.hpp"
#include "arena/WinLossOutcome.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "games/race42/Constants.hpp"

#include <compare>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace race42 {

/*
 * Race to 42: a shared counter starts at 0, and the players take turns bumping it by 2, 3 or 4.
 * The player whose bump lands exactly on kTarget wins. Overshooting it means both players lose.
 */
struct Game {
  struct Constants {
    static constexpr const char* kGameName = "race42";
  };

  struct Action {
    auto operator<=>(const Action&) const = default;

    int bump;
  };

  using Outcome = arena::WinLossOutcome;

  struct State : public arena::StateBase<State, Action> {
    auto operator<=>(const State&) const = default;

    // Throws std::invalid_argument for a bump not in kBumps.
    void make_next(Action action);

    // Empty once the game is decided.
    std::vector<Action> legal_actions() const;
    arena::PlayerColor current_player_turn() const { return current_player; }
    std::optional<Outcome> outcome() const;

    int counter = 0;
    arena::PlayerColor current_player = arena::PlayerColor::kBlack;
  };

  struct IO : public arena::IOBase {
    static std::string action_to_str(const Action& action);
    static void print_state(std::ostream& os, const State& state);
  };
};  // struct Game

}  // namespace race42

static_assert(arena::concepts::Game<race42::Game>);

#include "inline/games/race42/Game.inl"
