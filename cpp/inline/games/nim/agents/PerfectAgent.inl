#include "games/nim/agents/PerfectAgent.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

namespace nim {

inline auto PerfectAgent::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("nim::PerfectAgent options");
  return desc.template add_option<"strength", 's'>(
    po::value<int>(&strength)->default_value(strength), "strength (0-1). 0 is random, 1 is perfect.");
}

inline PerfectAgent::PerfectAgent(const Params& params) : params_(params) {
  CLEAN_ASSERT(params_.strength >= 0 && params_.strength <= 1, "strength must be in [0, 1]");
}

inline PerfectAgent::Action PerfectAgent::pick_action(const State& state, action_span_t actions) {
  if (params_.strength == 1) {
    int take = state.stones_left % (kMaxStonesToTake + 1);
    for (const Action& action : actions) {
      if (action.stones == take) {
        return action;
      }
    }
  }

  // losing position (or random play)
  return actions[util::Random::uniform_sample(0, actions.size())];
}

}  // namespace nim
