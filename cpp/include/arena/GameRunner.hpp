#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/BasicTypes.hpp"
#include "arena/concepts/GameConcept.hpp"

#include <memory>
#include <vector>

namespace arena {

/*
 * GameRunner plays a single game to completion between two agents.
 *
 * It owns both agents and the evolving State. play() consumes the runner:
 *
 * arena::GameRunner<Game> runner(std::move(black), std::move(white), start_state);
 * auto result = std::move(runner).play();
 *
 * The loop is strictly sequential. While the State reports no outcome, the agent whose color
 * matches current_player_turn() is shown the State and its legal actions, and the action it picks
 * is applied with make_next(). Exactly one action is applied per iteration, and none is applied
 * once outcome() has a value. A start State that is already terminal is returned without
 * consulting either agent's pick_action().
 *
 * Contract violations by the game or an agent fail fast:
 *
 * - An undecided State with no legal actions raises util::ReleaseAssertionError.
 * - An agent returning an action outside the offered set raises util::ReleaseAssertionError
 *   (only checked for equality-comparable Action types, and only if Params::validate_actions).
 * - A game still undecided after Params::max_turns turns raises util::Exception.
 *
 * There is no timeout on pick_action().
 */
template <concepts::Game Game>
class GameRunner {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using Outcome = Game::Outcome;
  using IO = Game::IO;
  using Agent = AbstractAgent<Game>;
  using agent_ptr_t = std::unique_ptr<Agent>;
  using action_vec_t = std::vector<Action>;
  using action_span_t = Agent::action_span_t;

  struct Params {
    auto make_options_description();

    int max_turns = 0;  // 0 means unlimited
    bool validate_actions = true;
  };

  struct Result {
    Outcome outcome;
    State final_state;
    turn_count_t num_turns = 0;
    action_vec_t actions;  // in the order they were applied
  };

  GameRunner(agent_ptr_t black_agent, agent_ptr_t white_agent, const State& start_state,
             const Params& params = Params(), game_id_t game_id = 0);

  Result play() &&;

 private:
  Agent* get_agent(PlayerColor color) const;
  void start_agents();
  void check_action(const action_vec_t& legal_actions, const Action& action,
                    PlayerColor color) const;
  void broadcast_state_change(PlayerColor mover, const Action& action);

  const Params params_;
  const game_id_t game_id_;
  agent_ptr_t black_agent_;
  agent_ptr_t white_agent_;
  State state_;
};

}  // namespace arena

#include "inline/arena/GameRunner.inl"
