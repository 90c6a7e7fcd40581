#pragma once

#include "arena/AbstractAgent.hpp"
#include "games/nim/Constants.hpp"
#include "games/nim/Game.hpp"

namespace nim {

/*
 * Leaves the opponent a multiple of (kMaxStonesToTake + 1) stones whenever possible. From any
 * other position this guarantees a win.
 */
class PerfectAgent : public arena::AbstractAgent<nim::Game> {
 public:
  using base_t = arena::AbstractAgent<nim::Game>;

  struct Params {
    /*
     * The strength parameter controls how well the agent plays. It is either 0 (random) or
     * 1 (perfect).
     */
    int strength = 1;
    auto make_options_description();
  };

  PerfectAgent(const Params&);

  Action pick_action(const State& state, action_span_t actions) override;

 private:
  const Params params_;
};

}  // namespace nim

#include "inline/games/nim/agents/PerfectAgent.inl"
