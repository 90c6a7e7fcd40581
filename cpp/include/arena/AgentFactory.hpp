#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/AbstractAgentGenerator.hpp"
#include "arena/BasicTypes.hpp"
#include "arena/concepts/GameConcept.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arena {

template <concepts::Game Game>
class AgentSubfactoryBase {
 public:
  virtual ~AgentSubfactoryBase() = default;
  virtual AbstractAgentGenerator<Game>* create() = 0;
};

/*
 * AgentSubfactory is a helper class used by AgentFactory. Each AgentSubfactory is associated
 * with a particular agent type.
 *
 * An AgentFactory in turn is associated with a list of AgentSubfactory objects. This list
 * corresponds to the list of agent types that the factory can create.
 */
template <typename GeneratorT>
class AgentSubfactory : public AgentSubfactoryBase<typename GeneratorT::Game> {
 public:
  GeneratorT* create() override { return new GeneratorT(); }
};

/*
 * The AgentFactory is a template class that facilitates the creation of agent generators from
 * command line arguments.
 *
 * See games/nim/AgentFactory.hpp for an example of how to use this class.
 */
template <concepts::Game Game_>
class AgentFactory {
 public:
  using Game = Game_;
  using Agent = AbstractAgent<Game>;
  using AgentGenerator = AbstractAgentGenerator<Game>;
  using AgentSubfactoryBase = arena::AgentSubfactoryBase<Game>;
  using generator_ptr_t = std::unique_ptr<AgentGenerator>;

  struct AgentGeneratorColor {
    generator_ptr_t generator;
    std::optional<PlayerColor> color;  // nullopt means the server picks
  };
  using agent_generator_color_vec_t = std::vector<AgentGeneratorColor>;
  using agent_subfactory_vec_t = std::vector<AgentSubfactoryBase*>;
  using subfactory_ptr_vec_t = std::vector<std::unique_ptr<AgentSubfactoryBase>>;

  struct Params {
    auto make_options_description();

    std::string type;
    std::string name;
    std::string color;
  };

  /*
   * The constructor takes ownership of a vector of subfactories. Each one provides a recipe for
   * how to determine whether a set of cmdline tokens match its generator type, and if so, how to
   * create agents.
   */
  AgentFactory(const agent_subfactory_vec_t& subfactories);

  AgentFactory(const AgentFactory&) = delete;
  AgentFactory& operator=(const AgentFactory&) = delete;

  agent_generator_color_vec_t parse(const std::vector<std::string>& agent_strs);
  void print_help(const std::vector<std::string>& agent_strs);

 private:
  static subfactory_ptr_vec_t take_ownership(const agent_subfactory_vec_t& subfactories);
  static std::string type_str(const AgentGenerator* generator);
  static bool matches(const AgentGenerator* generator, const std::string& type);
  generator_ptr_t parse_helper(const std::string& agent_str, const std::string& name,
                               const std::vector<std::string>& tokens);

  subfactory_ptr_vec_t subfactories_;
  std::map<std::string, std::string> name_map_;  // name -> agent_str
};

}  // namespace arena

#include "inline/arena/AgentFactory.inl"
