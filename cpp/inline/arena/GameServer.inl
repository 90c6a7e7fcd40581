#include "arena/GameServer.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <utility>

namespace arena {

template <concepts::Game Game>
auto GameServer<Game>::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("GameServer options");

  return desc
    .template add_option<"num-games", 'G'>(po::value<int>(&num_games)->default_value(num_games),
                                           "num games")
    .template add_flag<"alternate-colors", "fixed-colors">(
      &alternate_colors, "swap colors between consecutive games (unless fixed with --color)",
      "the first registered agent always plays Black (unless fixed with --color)")
    .template add_flag<"announce-game-results", "no-announce-game-results">(
      &announce_game_results, "log the result of each game", "do not log individual games")
    .template add_hidden_option<"print-game-states">(
      po::bool_switch(&print_game_states)->default_value(print_game_states),
      "print the final state of each game to stdout");
}

template <concepts::Game Game>
GameServer<Game>::GameServer(const Params& params, const RunnerParams& runner_params)
    : params_(params), runner_params_(runner_params) {
  CLEAN_ASSERT(params_.num_games >= 0, "Invalid --num-games {}", params_.num_games);
}

template <concepts::Game Game>
void GameServer<Game>::register_agent(generator_ptr_t generator,
                                      std::optional<PlayerColor> color) {
  if (!generator) {
    throw util::Exception("GameServer: null agent generator");
  }
  int n = registrations_.size();
  CLEAN_ASSERT(n < kNumPlayers, "Too many agents registered (max {})", kNumPlayers);
  if (color.has_value() && n > 0) {
    CLEAN_ASSERT(registrations_[0].color != color, "Both agents requested color {}", *color);
  }

  std::string name = generator->get_name();
  if (name.empty()) {
    name = generator->get_default_name();
  }
  names_[n] = name;
  registrations_.push_back(Registration{std::move(generator), color});
}

template <concepts::Game Game>
void GameServer<Game>::run() {
  int n = registrations_.size();
  CLEAN_ASSERT(n == kNumPlayers, "Expected {} agents, got {}", kNumPlayers, n);

  LOG_INFO("Playing {} game(s) of {}: {} vs {}", params_.num_games, Game::Constants::kGameName,
           names_[0], names_[1]);

  for (int g = 0; g < params_.num_games; ++g) {
    play_game(g);
  }
}

template <concepts::Game Game>
int GameServer<Game>::black_index(int game_index) const {
  DEBUG_ASSERT((int)registrations_.size() == kNumPlayers);

  const auto& color0 = registrations_[0].color;
  const auto& color1 = registrations_[1].color;
  if (color0.has_value()) {
    return *color0 == PlayerColor::kBlack ? 0 : 1;
  }
  if (color1.has_value()) {
    return *color1 == PlayerColor::kBlack ? 1 : 0;
  }
  if (params_.alternate_colors) {
    return game_index % 2;
  }
  return 0;
}

template <concepts::Game Game>
void GameServer<Game>::play_game(int game_index) {
  game_id_t game_id = next_game_id_++;

  std::array<int, kNumPlayers> index_by_seat;
  index_by_seat[to_seat(PlayerColor::kBlack)] = black_index(game_index);
  index_by_seat[to_seat(PlayerColor::kWhite)] = 1 - index_by_seat[to_seat(PlayerColor::kBlack)];

  std::array<std::unique_ptr<Agent>, kNumPlayers> agents;
  for (int s = 0; s < kNumPlayers; ++s) {
    int i = index_by_seat[s];
    agents[s].reset(registrations_[i].generator->generate_with_name());
    agents[s]->set_name(names_[i]);
  }

  Runner runner(std::move(agents[to_seat(PlayerColor::kBlack)]),
                std::move(agents[to_seat(PlayerColor::kWhite)]), State(), runner_params_,
                game_id);
  typename Runner::Result result = std::move(runner).play();

  for (int s = 0; s < kNumPlayers; ++s) {
    int i = index_by_seat[s];
    results_[i][result.outcome.score(from_seat(s))]++;
  }
  num_games_played_++;

  if (params_.announce_game_results) {
    LOG_INFO("Game {} complete ({} turns): Black={} White={} result={}", game_id,
             result.num_turns, names_[index_by_seat[0]], names_[index_by_seat[1]],
             IO::outcome_to_str(result.outcome));
  }
  if (params_.print_game_states) {
    IO::print_state(std::cout, result.final_state);
  }
}

template <concepts::Game Game>
std::string GameServer<Game>::get_results_str(const results_map_t& map) {
  int win = 0;
  int loss = 0;
  int draw = 0;
  float score = 0;

  for (auto it : map) {
    float f = it.first;
    int count = it.second;
    score += f * count;
    if (f == 1)
      win += count;
    else if (f == 0)
      loss += count;
    else
      draw += count;
  }
  return fmt::format("W{} L{} D{} [{:.16g}]", win, loss, draw, score);
}

template <concepts::Game Game>
void GameServer<Game>::print_summary() const {
  LOG_INFO("All games complete! ({} played)", num_games_played_);
  for (int i = 0; i < (int)registrations_.size(); ++i) {
    LOG_INFO("agent={} name={} {}", i, names_[i], get_results_str(results_[i]));
  }
}

}  // namespace arena
