#include "games/nim/Game.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace nim {

inline void Game::State::make_next(Action action) {
  if (action.stones < 1 || action.stones > kMaxStonesToTake || action.stones > stones_left) {
    throw std::invalid_argument(
      fmt::format("Invalid action: take {} of {} stones", action.stones, stones_left));
  }

  stones_left -= action.stones;
  current_player = arena::opponent(current_player);
}

inline std::vector<Game::Action> Game::State::legal_actions() const {
  std::vector<Action> actions;
  for (int k = 1; k <= kMaxStonesToTake && k <= stones_left; ++k) {
    actions.push_back(Action{k});
  }
  return actions;
}

inline std::optional<Game::Outcome> Game::State::outcome() const {
  if (stones_left > 0) return std::nullopt;

  // the previous mover took the last stone
  return Outcome::win(arena::opponent(current_player));
}

inline std::string Game::IO::action_to_str(const Action& action) {
  return std::to_string(action.stones);
}

inline void Game::IO::print_state(std::ostream& os, const State& state) {
  os << compact_state_repr(state) << std::endl;
}

inline std::string Game::IO::compact_state_repr(const State& state) {
  return fmt::format("[{}, {}]", state.stones_left, state.current_player);
}

}  // namespace nim
