#pragma once

#include "arena/AgentFactory.hpp"
#include "games/nim/Game.hpp"
#include "games/nim/agents/PerfectAgentGenerator.hpp"
#include "generic_agents/FirstActionAgentGenerator.hpp"
#include "generic_agents/HumanTuiAgentGenerator.hpp"
#include "generic_agents/RandomAgentGenerator.hpp"

namespace nim {

class AgentFactory : public arena::AgentFactory<Game> {
 public:
  using base_t = arena::AgentFactory<Game>;
  using agent_subfactory_vec_t = base_t::agent_subfactory_vec_t;

  AgentFactory() : base_t(make_subfactories()) {}

 private:
  static agent_subfactory_vec_t make_subfactories() {
    return {new arena::AgentSubfactory<generic::HumanTuiAgentGenerator<Game>>(),
            new arena::AgentSubfactory<nim::PerfectAgentGenerator>(),
            new arena::AgentSubfactory<generic::RandomAgentGenerator<Game>>(),
            new arena::AgentSubfactory<generic::FirstActionAgentGenerator<Game>>()};
  }
};

}  // namespace nim
