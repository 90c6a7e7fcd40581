#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/AbstractAgentGenerator.hpp"
#include "arena/BasicTypes.hpp"
#include "arena/GameRunner.hpp"
#include "arena/concepts/GameConcept.hpp"

#include <array>
#include <concepts>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arena {

/*
 * A GameServer plays a series of games between two registered agent generators, one game at a
 * time, and keeps per-agent win/loss/draw statistics.
 *
 * Each game gets freshly generated agents and a default-constructed (start) State, and is driven
 * by a GameRunner. An agent generator can be pinned to a color at registration; otherwise the
 * server assigns colors, swapping them between consecutive games if Params::alternate_colors is
 * set.
 */
template <concepts::Game Game>
class GameServer {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using Outcome = Game::Outcome;
  using IO = Game::IO;
  using Agent = AbstractAgent<Game>;
  using AgentGenerator = AbstractAgentGenerator<Game>;
  using generator_ptr_t = std::unique_ptr<AgentGenerator>;
  using Runner = GameRunner<Game>;
  using RunnerParams = Runner::Params;

  // score -> count
  using results_map_t = std::map<float, int>;

  static_assert(concepts::ScoredOutcome<Outcome>, "GameServer requires a scored Outcome");
  static_assert(std::default_initializable<State>, "GameServer starts from State()");

  struct Params {
    auto make_options_description();

    int num_games = 1;
    bool alternate_colors = true;
    bool announce_game_results = false;
    bool print_game_states = false;
  };

  GameServer(const Params& params, const RunnerParams& runner_params = RunnerParams());

  /*
   * Registers an agent generator. If color is specified, the generated agents always play that
   * color. At most two generators can be registered, and they cannot request the same color.
   */
  void register_agent(generator_ptr_t generator, std::optional<PlayerColor> color = std::nullopt);

  void run();

  int num_games_played() const { return num_games_played_; }

  // index is the registration order
  const results_map_t& get_results(int index) const { return results_[index]; }
  const std::string& get_agent_name(int index) const { return names_[index]; }

  static std::string get_results_str(const results_map_t& map);
  void print_summary() const;

 private:
  struct Registration {
    generator_ptr_t generator;
    std::optional<PlayerColor> color;
  };

  // Returns the registration index playing black in the given game.
  int black_index(int game_index) const;
  void play_game(int game_index);

  const Params params_;
  const RunnerParams runner_params_;
  std::vector<Registration> registrations_;
  std::array<results_map_t, kNumPlayers> results_;
  std::array<std::string, kNumPlayers> names_;
  game_id_t next_game_id_ = 0;
  int num_games_played_ = 0;
};

}  // namespace arena

#include "inline/arena/GameServer.inl"
