#pragma once

#include "arena/AbstractAgent.hpp"
#include "arena/concepts/GameConcept.hpp"
#include "util/BoostUtil.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace arena {

/*
 * An AbstractAgentGenerator is a class that can create AbstractAgent instances via its generate()
 * method. Fundamentally, you can think of it as a std::function<AbstractAgent*()>, but with a few
 * extra features.
 *
 * GameServer plays many games in succession, and every game gets fresh agents, so it must be
 * handed a recipe for agents rather than an agent.
 *
 * The class also provides a way to parse arguments passed from the command line. The command line
 * will have two instances of --agent, looking something like:
 *
 * --agent "--type=TUI --sub-arg1=val1 --sub-arg2 val2 ..."
 *
 * Each AbstractAgentGenerator subclass specifies which --type= strings it matches, and how to
 * parse the other sub-arguments in order to construct an agent.
 */
template <concepts::Game Game_>
class AbstractAgentGenerator {
 public:
  using Game = Game_;
  using Agent = AbstractAgent<Game>;

  virtual ~AbstractAgentGenerator() = default;

  virtual std::string get_default_name() const = 0;

  /*
   * Returns a list of strings that match against the --type argument.
   *
   * We use a vector instead of a single string so that we can have multiple names for the same
   * agent generator, thus allowing for shortcuts/aliases.
   */
  virtual std::vector<std::string> get_types() const = 0;

  /*
   * A short description of the agent type, used in help messages.
   */
  virtual std::string get_description() const = 0;

  /*
   * Generate a new agent. The caller is responsible for taking ownership of the pointer.
   */
  virtual Agent* generate() = 0;

  /*
   * Print help for this agent generator, describing what parse_args() expects.
   *
   * If there are no associated options for this agent type, then this method does not need to be
   * overriden.
   */
  virtual void print_help(std::ostream&) {}

  /*
   * Takes a list of arguments and parses them. This is called before generate(). The tokens that
   * will be passed here are extracted from the value of an --agent argument, with the --type,
   * --name, and --color parts removed.
   *
   * The default implementation accepts no arguments.
   */
  virtual void parse_args(const std::vector<std::string>& args);

  const std::string& get_name() const { return name_; }

  /*
   * Validates name, raising an exception if the name is invalid (too long or uses invalid
   * characters).
   */
  void set_name(const std::string& name);

  /*
   * Convenience method that composes generate() with set_name(). Falls back to
   * get_default_name() if no name was set.
   */
  Agent* generate_with_name();

 protected:
  /*
   * Helper function for parse_args() that some subclasses may find useful.
   */
  template <typename T>
  void parse_args_helper(T&& desc, const std::vector<std::string>& args) {
    namespace po2 = boost_util::program_options;
    po2::parse_args(desc, args);
  }

 private:
  std::string name_;
};

}  // namespace arena

#include "inline/arena/AbstractAgentGenerator.inl"
