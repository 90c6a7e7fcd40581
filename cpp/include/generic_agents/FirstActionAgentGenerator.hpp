#pragma once

#include "arena/AbstractAgentGenerator.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "generic_agents/FirstActionAgent.hpp"

#include <string>
#include <vector>

namespace generic {

template <arena::concepts::Game Game>
class FirstActionAgentGenerator : public arena::AbstractAgentGenerator<Game> {
 public:
  std::string get_default_name() const override { return "First"; }
  std::vector<std::string> get_types() const override { return {"First"}; }
  std::string get_description() const override { return "Always plays the first legal action"; }
  arena::AbstractAgent<Game>* generate() override { return new FirstActionAgent<Game>(); }
};

}  // namespace generic
