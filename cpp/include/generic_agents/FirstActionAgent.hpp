#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/concepts/GameConcept.hpp"

namespace generic {

/*
 * FirstActionAgent always chooses the first of the offered legal actions. Handy as a
 * deterministic opponent in tests.
 */
template <arena::concepts::Game Game>
class FirstActionAgent : public arena::AbstractAgent<Game> {
 public:
  using base_t = arena::AbstractAgent<Game>;
  using State = base_t::State;
  using Action = base_t::Action;
  using action_span_t = base_t::action_span_t;

  Action pick_action(const State&, action_span_t actions) override { return actions[0]; }
};

}  // namespace generic
