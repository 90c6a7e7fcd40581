#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "util/Random.hpp"

namespace generic {

/*
 * RandomAgent always chooses uniformly at random among the set of legal actions.
 */
template <arena::concepts::Game Game>
class RandomAgent : public arena::AbstractAgent<Game> {
 public:
  using base_t = arena::AbstractAgent<Game>;
  using State = base_t::State;
  using Action = base_t::Action;
  using action_span_t = base_t::action_span_t;

  Action pick_action(const State&, action_span_t actions) override {
    return actions[util::Random::uniform_sample(0, actions.size())];
  }
};

}  // namespace generic
