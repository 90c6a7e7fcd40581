#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <cstring>
#include <iostream>

namespace {

enum class HelpRequest { kNone, kBrief, kFull };

HelpRequest scan_for_help(int argc, char** argv) {
  HelpRequest request = HelpRequest::kNone;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      if (request == HelpRequest::kNone) request = HelpRequest::kBrief;
    } else if (std::strcmp(argv[i], "--help-full") == 0) {
      request = HelpRequest::kFull;
    }
  }
  return request;
}

}  // namespace

// gtest exits from InitGoogleTest() when it sees --help, and our parser rejects --gtest_* flags.
// So help is detected by hand and our options printed first; InitGoogleTest() then prints its own
// help and strips its flags before parse_args() sees argv.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;
  util::Random::Params random_params;

  po2::options_description raw_desc("Test binary options");
  auto desc = raw_desc.template add_option<"help", 'h'>("print help")
                .template add_option<"help-full">("print help, including hidden options")
                .add(log_params.make_options_description())
                .add(random_params.make_options_description());

  HelpRequest help = scan_for_help(argc, argv);
  if (help != HelpRequest::kNone) {
    po2::Settings::help_full = help == HelpRequest::kFull;
    std::cout << desc << std::endl;

    // gtest knows only --help.
    static char help_arg[] = "--help";
    argc = 2;
    argv[1] = help_arg;
  }

  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Random::init(random_params);
  return RUN_ALL_TESTS();
}
