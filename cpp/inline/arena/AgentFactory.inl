#include "arena/AgentFactory.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <set>
#include <sstream>

namespace arena {

template <concepts::Game Game>
auto AgentFactory<Game>::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("AgentFactory options, for each instance of --agent \"...\"");
  return desc.template add_option<"type">(po::value<std::string>(&type), "required")
    .template add_option<"name">(po::value<std::string>(&name),
                                 "if unspecified, then a default name is chosen")
    .template add_option<"color">(po::value<std::string>(&color),
                                  "Black or White. If unspecified, then the color is assigned by "
                                  "the server, alternating between games if requested");
}

template <concepts::Game Game>
AgentFactory<Game>::AgentFactory(const agent_subfactory_vec_t& subfactories)
    : subfactories_(take_ownership(subfactories)) {
  // validate that the generator types don't overlap
  std::set<std::string> types;
  for (const auto& subfactory : subfactories_) {
    generator_ptr_t generator(subfactory->create());
    for (const auto& type : generator->get_types()) {
      if (types.count(type)) {
        throw util::Exception("AgentFactory: duplicate type: {}", type);
      }
      types.insert(type);
    }
  }
}

template <concepts::Game Game>
typename AgentFactory<Game>::subfactory_ptr_vec_t AgentFactory<Game>::take_ownership(
  const agent_subfactory_vec_t& subfactories) {
  subfactory_ptr_vec_t out;
  out.reserve(subfactories.size());
  for (auto* subfactory : subfactories) {
    out.emplace_back(subfactory);
  }
  return out;
}

template <concepts::Game Game>
typename AgentFactory<Game>::agent_generator_color_vec_t AgentFactory<Game>::parse(
  const std::vector<std::string>& agent_strs) {
  agent_generator_color_vec_t vec;

  for (const auto& agent_str : agent_strs) {
    std::vector<std::string> tokens = util::split(agent_str);

    std::string name = boost_util::pop_option_value(tokens, "name");
    std::string color_str = boost_util::pop_option_value(tokens, "color");

    AgentGeneratorColor entry;
    if (!color_str.empty()) {
      entry.color = parse_color(color_str);
      for (const auto& prev : vec) {
        CLEAN_ASSERT(prev.color != entry.color, "Two agents requested color {}", *entry.color);
      }
    }
    entry.generator = parse_helper(agent_str, name, tokens);
    vec.push_back(std::move(entry));
  }

  return vec;
}

template <concepts::Game Game>
void AgentFactory<Game>::print_help(const std::vector<std::string>& agent_strs) {
  Params params;
  std::cout << params.make_options_description();
  std::cout << "  --... ...             type-specific args, dependent on --type" << std::endl
            << std::endl;

  std::cout << "For each agent, you must pass something like:" << std::endl << std::endl;
  std::cout << "  --agent \"--type=Random --name=CPU <type-specific options...>\"" << std::endl;
  std::cout << "  --agent \"--type=TUI --name=Human --color=White <type-specific options...>\""
            << std::endl
            << std::endl;

  std::cout << "The set of legal --type values are:" << std::endl;

  std::vector<generator_ptr_t> generators;
  for (const auto& subfactory : subfactories_) {
    generators.emplace_back(subfactory->create());
  }
  for (const auto& generator : generators) {
    std::cout << "  " << type_str(generator.get()) << ": " << generator->get_description()
              << std::endl;
  }
  std::cout << std::endl;
  std::cout << "To see the options for a specific --type, pass -h --agent \"--type=<type>\""
            << std::endl;

  std::vector<bool> used_types(generators.size(), false);
  for (const std::string& s : agent_strs) {
    std::vector<std::string> tokens = util::split(s);
    std::string type = boost_util::get_option_value(tokens, "type");
    for (int g = 0; g < (int)generators.size(); ++g) {
      if (matches(generators[g].get(), type)) {
        used_types[g] = true;
        break;
      }
    }
  }

  for (int g = 0; g < (int)generators.size(); ++g) {
    if (!used_types[g]) continue;

    AgentGenerator* generator = generators[g].get();

    std::ostringstream ss;
    generator->print_help(ss);
    std::string s = ss.str();
    if (!s.empty()) {
      std::cout << std::endl
                << "--type=" << type_str(generator) << " options:" << std::endl
                << std::endl;

      for (const std::string& line : util::splitlines(s)) {
        std::cout << "  " << line << std::endl;
      }
    }
  }
}

template <concepts::Game Game>
std::string AgentFactory<Game>::type_str(const AgentGenerator* generator) {
  std::vector<std::string> types = generator->get_types();
  std::ostringstream ss;
  for (int k = 0; k < (int)types.size(); ++k) {
    if (k > 0) {
      ss << "/";
    }
    ss << types[k];
  }
  return ss.str();
}

template <concepts::Game Game>
bool AgentFactory<Game>::matches(const AgentGenerator* generator, const std::string& type) {
  for (const auto& t : generator->get_types()) {
    if (t == type) {
      return true;
    }
  }
  return false;
}

template <concepts::Game Game>
typename AgentFactory<Game>::generator_ptr_t AgentFactory<Game>::parse_helper(
  const std::string& agent_str, const std::string& name,
  const std::vector<std::string>& orig_tokens) {
  std::vector<std::string> tokens = orig_tokens;

  std::string type = boost_util::pop_option_value(tokens, "type");
  CLEAN_ASSERT(!type.empty(), "Must specify --type in --agent \"{}\"", agent_str);

  if (!name.empty()) {
    CLEAN_ASSERT(!name_map_.count(name), "Duplicate --name \"{}\"", name);
    name_map_[name] = agent_str;
  }

  generator_ptr_t matched_generator;
  std::vector<std::string> all_types;
  for (const auto& subfactory : subfactories_) {
    generator_ptr_t generator(subfactory->create());
    if (matches(generator.get(), type)) {
      CLEAN_ASSERT(matched_generator == nullptr, "Type {}: multiple matches", type);
      matched_generator = std::move(generator);
      continue;
    }
    all_types.push_back(type_str(generator.get()));
  }

  if (!matched_generator) {
    throw util::CleanException("Unknown type in --agent \"{}\" (valid types: {})", agent_str,
                               util::grammatically_join(all_types, "or"));
  }

  if (!name.empty()) {
    matched_generator->set_name(name);
  }
  matched_generator->parse_args(tokens);
  return matched_generator;
}

}  // namespace arena
