#pragma once

#include "arena/AbstractAgentGenerator.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "generic_agents/HumanTuiAgent.hpp"

#include <string>
#include <vector>

namespace generic {

template <arena::concepts::Game Game>
class HumanTuiAgentGenerator : public arena::AbstractAgentGenerator<Game> {
 public:
  std::string get_default_name() const override { return "Human"; }
  std::vector<std::string> get_types() const override { return {"TUI"}; }
  std::string get_description() const override { return "Human agent, playing from stdin"; }
  arena::AbstractAgent<Game>* generate() override { return new HumanTuiAgent<Game>(); }
};

}  // namespace generic
