#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/BasicTypes.hpp"
#include "arena/concepts/GameConcept.hpp"

#include <iostream>
#include <istream>
#include <optional>
#include <ostream>

namespace generic {

/*
 * Lets a human pick actions from a terminal. The state is printed with Game::IO::print_state(),
 * followed by the numbered legal actions. The user enters a number; invalid input is complained
 * about and prompted for again.
 *
 * The streams default to std::cin/std::cout. A closed input stream raises util::CleanException,
 * since there is no way to continue the game.
 */
template <arena::concepts::Game Game>
class HumanTuiAgent : public arena::AbstractAgent<Game> {
 public:
  using base_t = arena::AbstractAgent<Game>;
  using IO = Game::IO;
  using State = base_t::State;
  using Action = base_t::Action;
  using Outcome = base_t::Outcome;
  using action_span_t = base_t::action_span_t;

  HumanTuiAgent(std::istream& in = std::cin, std::ostream& out = std::cout) : in_(in), out_(out) {}

  bool start_game() override;
  void receive_state_change(arena::PlayerColor, const State&, const Action&) override;
  Action pick_action(const State&, action_span_t actions) override;
  void end_game(const State&, const Outcome&) override;

 protected:
  /*
   * Reads a line and returns the chosen index into actions, or -1 if the input is not a valid
   * index.
   */
  virtual int prompt_for_action(action_span_t actions);

  virtual void print_state(const State&);

  std::istream& in_;
  std::ostream& out_;
  std::optional<Action> last_action_;
  std::optional<arena::PlayerColor> last_mover_;
};

}  // namespace generic

#include "inline/generic_agents/HumanTuiAgent.inl"
