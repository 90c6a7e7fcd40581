#include "arena/AbstractAgentGenerator.hpp"

#include "arena/BasicTypes.hpp"
#include "util/Exception.hpp"

#include <fmt/ranges.h>

#include <cctype>

namespace arena {

template <concepts::Game Game>
void AbstractAgentGenerator<Game>::parse_args(const std::vector<std::string>& args) {
  if (!args.empty()) {
    throw util::CleanException("Agent type {} takes no options (got: {})", get_default_name(),
                               fmt::join(args, " "));
  }
}

template <concepts::Game Game>
void AbstractAgentGenerator<Game>::set_name(const std::string& name) {
  // check that only alphanumeric, dash or underscore are used in name:
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
      throw util::CleanException("Invalid character in agent name (\"{}\")", name);
    }
  }

  int name_size = name.size();
  if (name_size > kMaxNameLength) {
    throw util::CleanException("Agent name (\"{}\") too long ({} > {})", name, name_size,
                               kMaxNameLength);
  }

  name_ = name;
}

template <concepts::Game Game>
typename AbstractAgentGenerator<Game>::Agent* AbstractAgentGenerator<Game>::generate_with_name() {
  Agent* agent = generate();
  agent->set_name(name_.empty() ? get_default_name() : name_);
  return agent;
}

}  // namespace arena
