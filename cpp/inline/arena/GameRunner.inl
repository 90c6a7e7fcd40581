#include "arena/GameRunner.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <concepts>
#include <optional>
#include <utility>

namespace arena {

template <concepts::Game Game>
auto GameRunner<Game>::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("GameRunner options");

  return desc
    .template add_option<"max-turns">(
      po::value<int>(&max_turns)->default_value(max_turns),
      "abort a game that has not reached an outcome after this many turns (0 means unlimited)")
    .template add_flag<"validate-actions", "skip-action-validation">(
      &validate_actions, "check that each picked action is one of the legal actions",
      "trust agents to pick legal actions");
}

template <concepts::Game Game>
GameRunner<Game>::GameRunner(agent_ptr_t black_agent, agent_ptr_t white_agent,
                             const State& start_state, const Params& params, game_id_t game_id)
    : params_(params),
      game_id_(game_id),
      black_agent_(std::move(black_agent)),
      white_agent_(std::move(white_agent)),
      state_(start_state) {
  if (!black_agent_ || !white_agent_) {
    throw util::Exception("GameRunner: both agents are required (black={} white={})",
                          black_agent_ != nullptr, white_agent_ != nullptr);
  }
}

template <concepts::Game Game>
typename GameRunner<Game>::Result GameRunner<Game>::play() && {
  start_agents();

  action_vec_t actions;
  turn_count_t num_turns = 0;
  std::optional<Outcome> outcome = state_.outcome();

  while (!outcome.has_value()) {
    if (params_.max_turns > 0 && num_turns >= params_.max_turns) {
      throw util::Exception("Game {} reached no outcome within {} turns", game_id_,
                            params_.max_turns);
    }

    PlayerColor color = state_.current_player_turn();
    Agent* agent = get_agent(color);

    action_vec_t legal_actions = state_.legal_actions();
    RELEASE_ASSERT(!legal_actions.empty(), "Game {} turn {}: no legal actions for {}, no outcome",
                   game_id_, num_turns, color);

    Action action = agent->pick_action(state_, action_span_t(legal_actions));
    if (params_.validate_actions) {
      check_action(legal_actions, action, color);
    }

    LOG_DEBUG("Game {} turn {}: {} ({}) plays {}", game_id_, num_turns, agent->get_name(), color,
              IO::action_to_str(action));

    state_.make_next(action);
    actions.push_back(action);
    num_turns++;

    broadcast_state_change(color, action);
    outcome = state_.outcome();
  }

  if (!outcome->is_final()) {
    LOG_WARN("Game {} ended on non-final outcome {}", game_id_, IO::outcome_to_str(*outcome));
  }

  black_agent_->end_game(state_, *outcome);
  white_agent_->end_game(state_, *outcome);

  LOG_DEBUG("Game {} complete after {} turns: {}", game_id_, num_turns,
            IO::outcome_to_str(*outcome));

  return Result{*outcome, std::move(state_), num_turns, std::move(actions)};
}

template <concepts::Game Game>
typename GameRunner<Game>::Agent* GameRunner<Game>::get_agent(PlayerColor color) const {
  return color == PlayerColor::kBlack ? black_agent_.get() : white_agent_.get();
}

template <concepts::Game Game>
void GameRunner<Game>::start_agents() {
  for (PlayerColor color : {PlayerColor::kBlack, PlayerColor::kWhite}) {
    Agent* agent = get_agent(color);
    agent->init_game(game_id_, color);
    if (!agent->start_game()) {
      throw util::CleanException("Agent \"{}\" refused to play {} in game {}", agent->get_name(),
                                 color, game_id_);
    }
  }
}

template <concepts::Game Game>
void GameRunner<Game>::check_action(const action_vec_t& legal_actions, const Action& action,
                                    PlayerColor color) const {
  if constexpr (std::equality_comparable<Action>) {
    if (std::find(legal_actions.begin(), legal_actions.end(), action) == legal_actions.end()) {
      throw util::ReleaseAssertionError("Game {}: agent \"{}\" ({}) picked illegal action {}",
                                        game_id_, get_agent(color)->get_name(), color,
                                        IO::action_to_str(action));
    }
  }
}

template <concepts::Game Game>
void GameRunner<Game>::broadcast_state_change(PlayerColor mover, const Action& action) {
  black_agent_->receive_state_change(mover, state_, action);
  white_agent_->receive_state_change(mover, state_, action);
}

}  // namespace arena
