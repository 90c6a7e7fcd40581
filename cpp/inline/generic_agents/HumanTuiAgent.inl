#include "generic_agents/HumanTuiAgent.hpp"

#include "arena/concepts/OutcomeConcept.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace generic {

template <arena::concepts::Game Game>
inline bool HumanTuiAgent<Game>::start_game() {
  last_action_.reset();
  last_mover_.reset();
  out_ << fmt::format("Starting a game of {}. You are {}.", Game::Constants::kGameName,
                      this->get_my_color())
       << std::endl;
  return true;
}

template <arena::concepts::Game Game>
inline void HumanTuiAgent<Game>::receive_state_change(arena::PlayerColor mover, const State&,
                                                      const Action& action) {
  last_mover_ = mover;
  last_action_ = action;
}

template <arena::concepts::Game Game>
typename HumanTuiAgent<Game>::Action HumanTuiAgent<Game>::pick_action(const State& state,
                                                                     action_span_t actions) {
  print_state(state);
  for (int i = 0; i < (int)actions.size(); ++i) {
    out_ << fmt::format("  {}: {}", i, IO::action_to_str(actions[i])) << std::endl;
  }

  bool complain = false;
  while (true) {
    if (complain) {
      out_ << "Invalid input!" << std::endl;
    }
    complain = true;
    int index = prompt_for_action(actions);
    if (index < 0 || index >= (int)actions.size()) {
      continue;
    }
    return actions[index];
  }
}

template <arena::concepts::Game Game>
inline void HumanTuiAgent<Game>::end_game(const State& state, const Outcome& outcome) {
  print_state(state);
  out_ << "Game over: " << IO::outcome_to_str(outcome) << std::endl;

  if constexpr (arena::concepts::ScoredOutcome<Outcome>) {
    float score = outcome.score(this->get_my_color());
    if (score == 1) {
      out_ << "Congratulations, you win!" << std::endl;
    } else if (score == 0) {
      out_ << "Sorry, you lose." << std::endl;
    } else {
      out_ << "The game has ended in a draw." << std::endl;
    }
  }
}

template <arena::concepts::Game Game>
int HumanTuiAgent<Game>::prompt_for_action(action_span_t actions) {
  out_ << fmt::format("Enter action [0-{}]: ", actions.size() - 1);
  out_.flush();

  std::string input;
  if (!std::getline(in_, input)) {
    throw util::CleanException("Input closed while waiting for {}'s action", this->get_name());
  }
  try {
    size_t pos = 0;
    int index = std::stoi(input, &pos);
    return pos == input.size() ? index : -1;
  } catch (const std::logic_error&) {
    return -1;
  }
}

template <arena::concepts::Game Game>
inline void HumanTuiAgent<Game>::print_state(const State& state) {
  if (last_action_.has_value()) {
    out_ << fmt::format("Last action: {} played {}", *last_mover_,
                        IO::action_to_str(*last_action_))
         << std::endl;
  }
  IO::print_state(out_, state);
}

}  // namespace generic
