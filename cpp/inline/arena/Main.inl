#include "arena/Main.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <iostream>
#include <utility>

namespace arena {

template <typename AgentFactory>
auto Main<AgentFactory>::Args::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Program options");

  return desc.template add_option<"agent">(po::value<std::vector<std::string>>(&agent_strs),
                                           "Space-delimited list of agent options, wrapped "
                                           "in quotes, to be specified twice");
}

template <typename AgentFactory>
int Main<AgentFactory>::main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    GameServerParams game_server_params;
    RunnerParams runner_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("print help")
                  .template add_option<"help-full">("print help, including hidden options")
                  .add(args.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description())
                  .add(game_server_params.make_options_description())
                  .add(runner_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    AgentFactory agent_factory;
    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      agent_factory.print_help(args.agent_strs);
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    GameServer server(game_server_params, runner_params);
    for (auto& entry : agent_factory.parse(args.agent_strs)) {
      server.register_agent(std::move(entry.generator), entry.color);
    }
    server.run();
    server.print_summary();
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}

}  // namespace arena
