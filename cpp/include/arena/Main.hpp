#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/GameRunner.hpp"
#include "arena/GameServer.hpp"

#include <boost/program_options.hpp>

#include <string>
#include <vector>

namespace arena {

/*
 * Shared main() for the game executables:
 *
 * int main(int ac, char* av[]) { return arena::Main<nim::AgentFactory>::main(ac, av); }
 */
template <typename AgentFactory>
struct Main {
  using Game = AgentFactory::Game;
  using GameServer = arena::GameServer<Game>;
  using GameServerParams = GameServer::Params;
  using RunnerParams = GameRunner<Game>::Params;
  using Agent = AbstractAgent<Game>;

  struct Args {
    std::vector<std::string> agent_strs;

    auto make_options_description();
  };

  static int main(int ac, char* av[]);
};

}  // namespace arena

#include "inline/arena/Main.inl"
