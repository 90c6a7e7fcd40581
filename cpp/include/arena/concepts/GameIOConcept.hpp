#pragma once

#include <concepts>
#include <ostream>
#include <string>

namespace arena {
namespace concepts {

template <class IO, class State, class Action, class Outcome>
concept GameIO = requires(std::ostream& os, const State& state, const Action& action,
                          const Outcome& outcome) {
  { IO::action_to_str(action) } -> std::same_as<std::string>;
  { IO::outcome_to_str(outcome) } -> std::same_as<std::string>;
  { IO::print_state(os, state) };
};

}  // namespace concepts
}  // namespace arena
