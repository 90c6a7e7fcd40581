#pragma once

#include "arena/BasicTypes.hpp"
#include "arena/IOBase.hpp"
#include "arena/StateBase.hpp"
#include "arena/WinLossOutcome.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "games/nim/Constants.hpp"

#include <compare>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace nim {

/*
 * Two players take turns removing 1 to kMaxStonesToTake stones from a single pile. Whoever takes
 * the last stone wins.
 */
struct Game {
  struct Constants {
    static constexpr const char* kGameName = "nim";
  };

  struct Action {
    auto operator<=>(const Action&) const = default;

    int stones;  // number of stones to take
  };

  using Outcome = arena::WinLossOutcome;

  struct State : public arena::StateBase<State, Action> {
    State() = default;
    State(int s, arena::PlayerColor c) : stones_left(s), current_player(c) {}

    auto operator<=>(const State&) const = default;

    // Throws std::invalid_argument if action is not legal.
    void make_next(Action action);
    std::vector<Action> legal_actions() const;
    arena::PlayerColor current_player_turn() const { return current_player; }
    std::optional<Outcome> outcome() const;

    int stones_left = kStartingStones;
    arena::PlayerColor current_player = arena::PlayerColor::kBlack;
  };

  struct IO : public arena::IOBase {
    static std::string action_to_str(const Action& action);
    static void print_state(std::ostream& os, const State& state);
    static std::string compact_state_repr(const State& state);
  };
};  // struct Game

}  // namespace nim

static_assert(arena::concepts::Game<nim::Game>);

#include "inline/games/nim/Game.inl"
