#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/AbstractAgentGenerator.hpp"
#include "games/nim/Game.hpp"
#include "games/nim/agents/PerfectAgent.hpp"
#include "util/BoostUtil.hpp"

#include <string>
#include <vector>

namespace nim {

class PerfectAgentGenerator : public arena::AbstractAgentGenerator<nim::Game> {
 public:
  using Agent = arena::AbstractAgent<nim::Game>;

  std::string get_default_name() const override { return "Perfect"; }
  std::vector<std::string> get_types() const override { return {"Perfect"}; }
  std::string get_description() const override { return "Perfect agent"; }
  Agent* generate() override { return new PerfectAgent(params_); }
  void print_help(std::ostream& s) override { params_.make_options_description().print(s); }
  void parse_args(const std::vector<std::string>& args) override {
    parse_args_helper(params_.make_options_description(), args);
  }

 private:
  PerfectAgent::Params params_;
};

}  // namespace nim
