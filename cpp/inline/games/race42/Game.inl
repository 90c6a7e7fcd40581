#include "games/race42/Game.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace race42 {

inline void Game::State::make_next(Action action) {
  if (std::find(kBumps.begin(), kBumps.end(), action.bump) == kBumps.end()) {
    throw std::invalid_argument(fmt::format("Invalid bump: {}", action.bump));
  }

  counter += action.bump;
  current_player = arena::opponent(current_player);
}

inline std::vector<Game::Action> Game::State::legal_actions() const {
  std::vector<Action> actions;
  if (outcome().has_value()) return actions;

  for (int bump : kBumps) {
    actions.push_back(Action{bump});
  }
  return actions;
}

inline std::optional<Game::Outcome> Game::State::outcome() const {
  if (counter < kTarget) return std::nullopt;
  if (counter > kTarget) return Outcome::both_lose();

  // current_player has already flipped, so the mover that hit the target is the opponent
  return Outcome::win(arena::opponent(current_player));
}

inline std::string Game::IO::action_to_str(const Action& action) {
  return fmt::format("+{}", action.bump);
}

inline void Game::IO::print_state(std::ostream& os, const State& state) {
  os << fmt::format("counter={}/{} to-move={}", state.counter, kTarget, state.current_player)
     << std::endl;
}

}  // namespace race42
