#include "arena/AbstractAgent.hpp"
#include "arena/AbstractAgentGenerator.hpp"
#include "arena/BasicTypes.hpp"
#include "arena/GameRunner.hpp"
#include "arena/GameServer.hpp"
#include "arena/IOBase.hpp"
#include "arena/StateBase.hpp"
#include "arena/WinLossOutcome.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "games/race42/AgentFactory.hpp"
#include "games/race42/Game.hpp"
#include "generic_agents/FirstActionAgent.hpp"
#include "generic_agents/FirstActionAgentGenerator.hpp"
#include "generic_agents/RandomAgent.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace {

using Race42 = race42::Game;
using PlayerColor = arena::PlayerColor;
using WinLossOutcome = arena::WinLossOutcome;

/*
 * A deliberately broken game: it never produces an outcome, and if stuck is set, it reports no
 * legal actions either.
 */
struct EndlessGame {
  struct Constants {
    static constexpr const char* kGameName = "endless";
  };

  struct Action {
    auto operator<=>(const Action&) const = default;
    int x;
  };

  using Outcome = arena::WinLossOutcome;

  struct State : public arena::StateBase<State, Action> {
    void make_next(Action) { turns++; }
    std::vector<Action> legal_actions() const {
      if (stuck) return {};
      return {Action{0}, Action{1}};
    }
    PlayerColor current_player_turn() const { return arena::from_seat(turns % 2); }
    std::optional<Outcome> outcome() const { return std::nullopt; }

    int turns = 0;
    bool stuck = false;
  };

  struct IO : public arena::IOBase {
    static std::string action_to_str(const Action& action) {
      num_action_strs++;
      return std::to_string(action.x);
    }
    static void print_state(std::ostream& os, const State& state) { os << state.turns; }

    static inline int num_action_strs = 0;
  };
};

static_assert(arena::concepts::Game<EndlessGame>);

using event_log_t = std::vector<std::string>;

/*
 * Appends every hook invocation to a shared log, and otherwise plays the first legal action.
 */
template <arena::concepts::Game Game>
class RecordingAgent : public arena::AbstractAgent<Game> {
 public:
  using base_t = arena::AbstractAgent<Game>;
  using State = base_t::State;
  using Action = base_t::Action;
  using Outcome = base_t::Outcome;
  using action_span_t = base_t::action_span_t;

  RecordingAgent(event_log_t* log, bool refuse = false) : log_(log), refuse_(refuse) {}

  bool start_game() override {
    log_->push_back(fmt::format("{} start {}", this->get_my_color(), this->get_game_id()));
    return !refuse_;
  }

  void receive_state_change(PlayerColor mover, const State&, const Action&) override {
    log_->push_back(fmt::format("{} sees {}", this->get_my_color(), mover));
  }

  Action pick_action(const State& state, action_span_t actions) override {
    EXPECT_EQ(state.current_player_turn(), this->get_my_color());
    log_->push_back(fmt::format("{} pick", this->get_my_color()));
    return actions[0];
  }

  void end_game(const State&, const Outcome&) override {
    log_->push_back(fmt::format("{} end", this->get_my_color()));
  }

 private:
  event_log_t* log_;
  const bool refuse_;
};

// Always returns the same action, legal or not.
template <arena::concepts::Game Game>
class StubbornAgent : public arena::AbstractAgent<Game> {
 public:
  using base_t = arena::AbstractAgent<Game>;
  using State = base_t::State;
  using Action = base_t::Action;
  using action_span_t = base_t::action_span_t;

  StubbornAgent(Action action) : action_(action) {}
  Action pick_action(const State&, action_span_t) override { return action_; }

 private:
  const Action action_;
};

class RecordingAgentGenerator : public arena::AbstractAgentGenerator<Race42> {
 public:
  RecordingAgentGenerator(event_log_t* log) : log_(log) {}

  std::string get_default_name() const override { return "Recorder"; }
  std::vector<std::string> get_types() const override { return {"Recorder"}; }
  std::string get_description() const override { return "Recording agent"; }
  Agent* generate() override { return new RecordingAgent<Race42>(log_); }

 private:
  event_log_t* log_;
};

// Counts its own destructions.
class CountingSubfactory
    : public arena::AgentSubfactory<generic::FirstActionAgentGenerator<Race42>> {
 public:
  CountingSubfactory(int* num_destroyed) : num_destroyed_(num_destroyed) {}
  ~CountingSubfactory() override { (*num_destroyed_)++; }

 private:
  int* num_destroyed_;
};

template <arena::concepts::Game Game>
std::unique_ptr<arena::AbstractAgent<Game>> make_first() {
  return std::make_unique<generic::FirstActionAgent<Game>>();
}

template <arena::concepts::Game Game>
std::unique_ptr<arena::AbstractAgent<Game>> make_random() {
  return std::make_unique<generic::RandomAgent<Game>>();
}

// All states reachable from the start state, including terminal ones.
std::vector<Race42::State> reachable_race42_states() {
  std::vector<Race42::State> out;
  std::set<std::pair<int, int>> seen;
  std::vector<Race42::State> stack = {Race42::State()};
  while (!stack.empty()) {
    Race42::State state = stack.back();
    stack.pop_back();
    auto key = std::make_pair(state.counter, (int)arena::to_seat(state.current_player));
    if (seen.count(key)) continue;
    seen.insert(key);
    out.push_back(state);
    for (const auto& action : state.legal_actions()) {
      stack.push_back(state.next(action));
    }
  }
  return out;
}

}  // namespace

TEST(PlayerColor, helpers) {
  EXPECT_EQ(arena::opponent(PlayerColor::kBlack), PlayerColor::kWhite);
  EXPECT_EQ(arena::opponent(PlayerColor::kWhite), PlayerColor::kBlack);
  EXPECT_LT(PlayerColor::kBlack, PlayerColor::kWhite);

  EXPECT_EQ(arena::to_seat(PlayerColor::kBlack), 0);
  EXPECT_EQ(arena::to_seat(PlayerColor::kWhite), 1);
  EXPECT_EQ(arena::from_seat(1), PlayerColor::kWhite);
  EXPECT_THROW(arena::from_seat(2), util::Exception);
  EXPECT_THROW(arena::from_seat(-1), util::Exception);

  EXPECT_EQ(arena::color_name(PlayerColor::kBlack), "Black");
  EXPECT_EQ(fmt::format("{}", PlayerColor::kWhite), "White");

  EXPECT_EQ(arena::parse_color("white"), PlayerColor::kWhite);
  EXPECT_EQ(arena::parse_color("BLACK"), PlayerColor::kBlack);
  EXPECT_THROW(arena::parse_color("red"), util::CleanException);
}

TEST(WinLossOutcome, score) {
  WinLossOutcome white_wins = WinLossOutcome::win(PlayerColor::kWhite);
  EXPECT_EQ(white_wins.winner(), PlayerColor::kWhite);
  EXPECT_EQ(white_wins.score(PlayerColor::kWhite), 1);
  EXPECT_EQ(white_wins.score(PlayerColor::kBlack), 0);
  EXPECT_EQ(white_wins.to_str(), "WhiteWins");
  EXPECT_TRUE(white_wins.is_final());

  EXPECT_EQ(WinLossOutcome::draw().score(PlayerColor::kBlack), 0.5);
  EXPECT_FALSE(WinLossOutcome::draw().winner().has_value());

  WinLossOutcome both_lose = WinLossOutcome::both_lose();
  EXPECT_EQ(both_lose.score(PlayerColor::kBlack), 0);
  EXPECT_EQ(both_lose.score(PlayerColor::kWhite), 0);
  EXPECT_EQ(both_lose.to_str(), "BothLose");

  EXPECT_EQ(WinLossOutcome::win(PlayerColor::kBlack), WinLossOutcome{WinLossOutcome::kBlackWins});
  EXPECT_NE(WinLossOutcome::draw(), both_lose);
}

TEST(GameRunner, race42_first_action_agents) {
  arena::GameRunner<Race42> runner(make_first<Race42>(), make_first<Race42>(), Race42::State());
  auto result = std::move(runner).play();

  EXPECT_EQ(result.outcome, WinLossOutcome::win(PlayerColor::kBlack));
  EXPECT_EQ(result.num_turns, 21);
  EXPECT_EQ(result.final_state.counter, 42);
  ASSERT_EQ(result.actions.size(), 21);
  for (const auto& action : result.actions) {
    EXPECT_EQ(action.bump, 2);
  }
}

TEST(GameRunner, terminates_within_bound) {
  util::Random::set_seed(1);
  for (int i = 0; i < 200; ++i) {
    arena::GameRunner<Race42>::Params params;
    params.max_turns = race42::kTarget;  // every bump is at least 1
    arena::GameRunner<Race42> runner(make_random<Race42>(), make_random<Race42>(), Race42::State(),
                                     params, i);
    auto result = std::move(runner).play();

    EXPECT_LE(result.num_turns, race42::kTarget / race42::kBumps[0]);
    EXPECT_GE(result.final_state.counter, race42::kTarget);
    ASSERT_TRUE(result.final_state.outcome().has_value());
    EXPECT_EQ(*result.final_state.outcome(), result.outcome);
  }
}

TEST(GameRunner, outcome_appears_only_at_the_end) {
  util::Random::set_seed(2);
  arena::GameRunner<Race42> runner(make_random<Race42>(), make_random<Race42>(), Race42::State());
  auto result = std::move(runner).play();

  // Replaying the recorded actions: undecided at every prefix, decided exactly at the end.
  Race42::State state;
  for (const auto& action : result.actions) {
    EXPECT_FALSE(state.outcome().has_value());
    state.make_next(action);
  }
  EXPECT_EQ(state, result.final_state);
  EXPECT_EQ(state.outcome(), result.outcome);
}

TEST(GameRunner, turns_alternate) {
  event_log_t log;
  arena::GameRunner<Race42> runner(std::make_unique<RecordingAgent<Race42>>(&log),
                                   std::make_unique<RecordingAgent<Race42>>(&log),
                                   Race42::State());
  auto result = std::move(runner).play();

  std::vector<std::string> picks;
  for (const auto& event : log) {
    if (event.ends_with(" pick")) picks.push_back(event);
  }
  ASSERT_EQ((int)picks.size(), result.num_turns);
  for (int i = 0; i < (int)picks.size(); ++i) {
    EXPECT_EQ(picks[i], i % 2 == 0 ? "Black pick" : "White pick");
  }
}

TEST(GameRunner, hook_order) {
  Race42::State start;
  start.counter = 38;

  event_log_t log;
  arena::GameRunner<Race42> runner(std::make_unique<RecordingAgent<Race42>>(&log),
                                   std::make_unique<RecordingAgent<Race42>>(&log), start,
                                   arena::GameRunner<Race42>::Params(), 7);
  auto result = std::move(runner).play();

  EXPECT_EQ(result.outcome, WinLossOutcome::win(PlayerColor::kWhite));
  event_log_t expected = {"Black start 7", "White start 7", "Black pick", "Black sees Black",
                          "White sees Black", "White pick", "Black sees White", "White sees White",
                          "Black end", "White end"};
  EXPECT_EQ(log, expected);
}

TEST(GameRunner, terminal_start_state) {
  Race42::State start;
  start.counter = race42::kTarget;

  event_log_t log;
  arena::GameRunner<Race42> runner(std::make_unique<RecordingAgent<Race42>>(&log),
                                   std::make_unique<RecordingAgent<Race42>>(&log), start);
  auto result = std::move(runner).play();

  EXPECT_EQ(result.num_turns, 0);
  EXPECT_TRUE(result.actions.empty());
  EXPECT_EQ(result.final_state, start);
  EXPECT_EQ(result.outcome, *start.outcome());
  event_log_t expected = {"Black start 0", "White start 0", "Black end", "White end"};
  EXPECT_EQ(log, expected);
}

TEST(GameRunner, illegal_action) {
  arena::GameRunner<Race42> runner(std::make_unique<StubbornAgent<Race42>>(Race42::Action{5}),
                                   make_first<Race42>(), Race42::State());
  EXPECT_THROW(std::move(runner).play(), util::ReleaseAssertionError);
}

TEST(GameRunner, illegal_action_unvalidated) {
  // Without validation, the game's own make_next() check is all that is left.
  arena::GameRunner<Race42>::Params params;
  params.validate_actions = false;
  arena::GameRunner<Race42> runner(std::make_unique<StubbornAgent<Race42>>(Race42::Action{5}),
                                   make_first<Race42>(), Race42::State(), params);
  EXPECT_THROW(std::move(runner).play(), std::invalid_argument);
}

TEST(GameRunner, no_legal_actions) {
  EndlessGame::State start;
  start.stuck = true;

  event_log_t log;
  arena::GameRunner<EndlessGame> runner(std::make_unique<RecordingAgent<EndlessGame>>(&log),
                                        std::make_unique<RecordingAgent<EndlessGame>>(&log),
                                        start);
  EXPECT_THROW(std::move(runner).play(), util::ReleaseAssertionError);
  for (const auto& event : log) {
    EXPECT_FALSE(event.ends_with(" pick"));
  }
}

TEST(GameRunner, max_turns) {
  arena::GameRunner<EndlessGame>::Params params;
  params.max_turns = 10;
  arena::GameRunner<EndlessGame> runner(make_first<EndlessGame>(), make_first<EndlessGame>(),
                                        EndlessGame::State(), params);
  EXPECT_THROW(std::move(runner).play(), util::Exception);
}

TEST(GameRunner, legal_actions_are_not_stringified) {
  EndlessGame::IO::num_action_strs = 0;

  arena::GameRunner<EndlessGame>::Params params;
  params.max_turns = 10;
  arena::GameRunner<EndlessGame> runner(make_first<EndlessGame>(), make_first<EndlessGame>(),
                                        EndlessGame::State(), params);
  EXPECT_THROW(std::move(runner).play(), util::Exception);

  // Only the per-move LOG_DEBUG formats actions, and it is compiled out at the default level.
  if (SPDLOG_ACTIVE_LEVEL > SPDLOG_LEVEL_DEBUG) {
    EXPECT_EQ(EndlessGame::IO::num_action_strs, 0);
  }

  arena::GameRunner<EndlessGame> bad_runner(
    std::make_unique<StubbornAgent<EndlessGame>>(EndlessGame::Action{7}),
    make_first<EndlessGame>(), EndlessGame::State(), params);
  EXPECT_THROW(std::move(bad_runner).play(), util::ReleaseAssertionError);
  EXPECT_GE(EndlessGame::IO::num_action_strs, 1);
}

TEST(GameRunner, refused_game) {
  event_log_t log;
  arena::GameRunner<Race42> runner(std::make_unique<RecordingAgent<Race42>>(&log),
                                   std::make_unique<RecordingAgent<Race42>>(&log, true),
                                   Race42::State());
  EXPECT_THROW(std::move(runner).play(), util::CleanException);
}

TEST(GameRunner, null_agent) {
  EXPECT_THROW(arena::GameRunner<Race42>(make_first<Race42>(), nullptr, Race42::State()),
               util::Exception);
}

TEST(State, next_matches_make_next) {
  for (const auto& state : reachable_race42_states()) {
    for (const auto& action : state.legal_actions()) {
      Race42::State copy = state;
      Race42::State next = state.next(action);
      EXPECT_EQ(copy, state);

      copy.make_next(action);
      EXPECT_EQ(copy, next);
    }
  }
}

TEST(State, undecided_states_have_legal_actions) {
  std::vector<Race42::State> states = reachable_race42_states();
  EXPECT_GT(states.size(), race42::kTarget);
  for (const auto& state : states) {
    EXPECT_EQ(state.outcome().has_value(), state.legal_actions().empty())
      << "counter=" << state.counter;
  }
}

TEST(GameServer, alternating_colors) {
  arena::GameServer<Race42>::Params params;
  params.num_games = 4;
  arena::GameServer<Race42> server(params);
  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>());
  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>());
  server.run();
  server.print_summary();

  // Black always wins between first-action agents.
  EXPECT_EQ(server.num_games_played(), 4);
  EXPECT_EQ(server.get_agent_name(0), "First");
  arena::GameServer<Race42>::results_map_t expected = {{0, 2}, {1, 2}};
  EXPECT_EQ(server.get_results(0), expected);
  EXPECT_EQ(server.get_results(1), expected);
  EXPECT_EQ(arena::GameServer<Race42>::get_results_str(server.get_results(0)), "W2 L2 D0 [2]");
}

TEST(GameServer, fixed_colors) {
  arena::GameServer<Race42>::Params params;
  params.num_games = 3;
  params.alternate_colors = false;
  arena::GameServer<Race42> server(params);
  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>());
  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>());
  server.run();

  EXPECT_EQ(arena::GameServer<Race42>::get_results_str(server.get_results(0)), "W3 L0 D0 [3]");
  EXPECT_EQ(arena::GameServer<Race42>::get_results_str(server.get_results(1)), "W0 L3 D0 [0]");
}

TEST(GameServer, requested_color) {
  arena::GameServer<Race42>::Params params;
  params.num_games = 2;
  arena::GameServer<Race42> server(params);
  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>());
  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>(),
                        PlayerColor::kBlack);
  server.run();

  EXPECT_EQ(arena::GameServer<Race42>::get_results_str(server.get_results(1)), "W2 L0 D0 [2]");
}

TEST(GameServer, unique_game_ids) {
  event_log_t log;
  arena::GameServer<Race42>::Params params;
  params.num_games = 3;
  arena::GameServer<Race42> server(params);
  server.register_agent(std::make_unique<RecordingAgentGenerator>(&log));
  server.register_agent(std::make_unique<RecordingAgentGenerator>(&log));
  server.run();

  std::set<std::string> starts;
  for (const auto& event : log) {
    if (event.starts_with("Black start")) starts.insert(event);
  }
  EXPECT_EQ(starts.size(), 3);
}

TEST(GameServer, registration_errors) {
  arena::GameServer<Race42> server(arena::GameServer<Race42>::Params{});
  EXPECT_THROW(server.run(), util::CleanException);

  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>(),
                        PlayerColor::kWhite);
  EXPECT_THROW(
    server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>(),
                          PlayerColor::kWhite),
    util::CleanException);
  server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>());
  EXPECT_THROW(
    server.register_agent(std::make_unique<generic::FirstActionAgentGenerator<Race42>>()),
    util::CleanException);
}

TEST(AgentFactory, parse) {
  race42::AgentFactory factory;
  auto entries = factory.parse({"--type=First --name=Alice --color=white", "--type Random"});

  ASSERT_EQ(entries.size(), 2);
  EXPECT_EQ(entries[0].generator->get_name(), "Alice");
  EXPECT_EQ(entries[0].color, PlayerColor::kWhite);
  EXPECT_EQ(entries[0].generator->get_types(), std::vector<std::string>{"First"});
  EXPECT_EQ(entries[1].generator->get_name(), "");
  EXPECT_FALSE(entries[1].color.has_value());

  std::unique_ptr<arena::AbstractAgent<Race42>> agent(entries[1].generator->generate_with_name());
  EXPECT_EQ(agent->get_name(), "Random");
}

TEST(AgentFactory, parse_errors) {
  race42::AgentFactory factory;
  EXPECT_THROW(factory.parse({"--type=Bogus"}), util::CleanException);
  EXPECT_THROW(factory.parse({"--name=Alice"}), util::CleanException);
  EXPECT_THROW(factory.parse({"--type=First --color=Red"}), util::CleanException);
  EXPECT_THROW(factory.parse({"--type=First --bogus=1"}), util::CleanException);
  EXPECT_THROW(factory.parse({"--type=First --name=has.dot"}), util::CleanException);
  EXPECT_THROW(factory.parse({"--type=First --name=J\xc3\xb6" "e"}), util::CleanException);

  race42::AgentFactory factory2;
  EXPECT_THROW(factory2.parse({"--type=First --name=A", "--type=Random --name=A"}),
               util::CleanException);

  race42::AgentFactory factory3;
  EXPECT_THROW(factory3.parse({"--type=First --color=Black", "--type=Random --color=Black"}),
               util::CleanException);
}

TEST(AgentFactory, duplicate_types) {
  int num_destroyed = 0;
  {
    race42::AgentFactory::agent_subfactory_vec_t subfactories = {
      new CountingSubfactory(&num_destroyed), new CountingSubfactory(&num_destroyed)};
    EXPECT_THROW(arena::AgentFactory<Race42> factory(subfactories), util::Exception);
  }
  EXPECT_EQ(num_destroyed, 2);

  num_destroyed = 0;
  {
    arena::AgentFactory<Race42> factory({new CountingSubfactory(&num_destroyed)});
    EXPECT_EQ(num_destroyed, 0);
  }
  EXPECT_EQ(num_destroyed, 1);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
