#pragma once

#include "arena/BasicTypes.hpp"
#include "arena/concepts/GameConcept.hpp"

#include <span>
#include <string>

namespace arena {

/*
 * Base class for all agents.
 *
 * There is 1 pure virtual function to override, pick_action(), and 3 optional hooks:
 *
 * - start_game()
 * - receive_state_change()
 * - end_game()
 *
 * start_game() and end_game() are called when a game starts or ends. A single agent object lives
 * for a single game, but generators may hand out agents that share state across games through
 * the generator.
 *
 * receive_state_change() is called on both agents after every applied action. Note that you get
 * this callback even after you make your own move, as a sort of "echo" of your own action.
 *
 * pick_action() is called when it is your turn. The actions span is the State's legal_actions(),
 * computed by GameRunner, and is never empty. The returned action must be one of its elements.
 * The state reference is only valid for the duration of the call.
 */
template <concepts::Game Game>
class AbstractAgent {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using Outcome = Game::Outcome;
  using action_span_t = std::span<const Action>;

  virtual ~AbstractAgent() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  game_id_t get_game_id() const { return game_id_; }
  PlayerColor get_my_color() const { return my_color_; }

  void init_game(game_id_t game_id, PlayerColor color);

  // start_game() should return false if the agent refuses to play the game.
  virtual bool start_game() { return true; }

  virtual void receive_state_change(PlayerColor, const State&, const Action&) {}

  virtual Action pick_action(const State& state, action_span_t actions) = 0;

  virtual void end_game(const State&, const Outcome&) {}

 private:
  std::string name_;
  game_id_t game_id_ = -1;
  PlayerColor my_color_ = PlayerColor::kBlack;
};

}  // namespace arena

#include "inline/arena/AbstractAgent.inl"
