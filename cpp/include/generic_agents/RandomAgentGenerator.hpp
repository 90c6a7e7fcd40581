#pragma once

#include "arena/AbstractAgentGenerator.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "generic_agents/RandomAgent.hpp"

#include <string>
#include <vector>

namespace generic {

template <arena::concepts::Game Game>
class RandomAgentGenerator : public arena::AbstractAgentGenerator<Game> {
 public:
  std::string get_default_name() const override { return "Random"; }
  std::vector<std::string> get_types() const override { return {"Random"}; }
  std::string get_description() const override { return "Random agent"; }
  arena::AbstractAgent<Game>* generate() override { return new RandomAgent<Game>(); }
};

}  // namespace generic
