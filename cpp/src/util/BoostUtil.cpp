#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <optional>

namespace boost_util {

namespace {

struct OptionMatch {
  size_t index;       // position of the "--name" token
  size_t num_tokens;  // 1 for "--name=value", 2 for "--name value"
  std::string value;
};

// Locates --name in args. A trailing "--name" with no value yields num_tokens == 1 and an empty
// value.
std::optional<OptionMatch> find_option(const std::vector<std::string>& args,
                                       const std::string& option_name) {
  const std::string flag = "--" + option_name;
  const std::string prefix = flag + "=";
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == flag) {
      if (i + 1 < args.size()) return OptionMatch{i, 2, args[i + 1]};
      return OptionMatch{i, 1, ""};
    }
    if (arg.starts_with(prefix)) {
      return OptionMatch{i, 1, arg.substr(prefix.size())};
    }
  }
  return std::nullopt;
}

}  // namespace

std::string get_option_value(const std::vector<std::string>& args, const std::string& option_name) {
  auto match = find_option(args, option_name);
  return match ? match->value : "";
}

std::string pop_option_value(std::vector<std::string>& args, const std::string& option_name) {
  auto match = find_option(args, option_name);
  if (!match) return "";
  if (match->num_tokens == 1 && args[match->index].find('=') == std::string::npos) {
    throw util::CleanException("Missing value for option '{}'", option_name);
  }
  auto first = args.begin() + match->index;
  args.erase(first, first + match->num_tokens);
  return match->value;
}

}  // namespace boost_util
