#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace boost_util {

// Value of --name in args, given either as "--name=value" or as "--name value". Returns "" when
// the option is absent.
std::string get_option_value(const std::vector<std::string>& args, const std::string& option_name);

// get_option_value(), also erasing the option (and a separate value token) from args. Throws
// util::CleanException if "--name" is the last token.
std::string pop_option_value(std::vector<std::string>& args, const std::string& option_name);

namespace program_options {

struct Settings {
  // Set from --help-full before printing. Makes print() include hidden options.
  static inline bool help_full = false;
};

/*
 * Builder over boost::program_options::options_description. Option names and abbreviations are
 * template arguments, and every call returns a new type recording them, so
 *
 *   namespace po2 = boost_util::program_options;
 *   po2::options_description desc("Agent options");
 *   return desc
 *     .add_option<"type", 't'>(po::value(&type), "agent type")
 *     .add_option<"type">(...);
 *
 * fails with a static_assert instead of at parse time. Two descriptions are combined with add().
 *
 * Two boost descriptions sit underneath: one with every option and one without the hidden ones.
 * Copies returned by the builder share them.
 */
template <typename NameSeq_ = util::StringLiteralSequence<>,
          typename AbbrevSeq_ = util::char_sequence<>>
class options_description {
 public:
  using NameSeq = NameSeq_;
  using AbbrevSeq = AbbrevSeq_;
  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  // Abbrev == ' ' means no single-character form.
  template <util::StringLiteral Name, char Abbrev = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  // Listed only under --help-full.
  template <util::StringLiteral Name, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  // Registers both --on and --off for *flag. --help lists only the one that changes the current
  // value; --help-full lists both.
  template <util::StringLiteral OnName, util::StringLiteral OffName>
  auto add_flag(bool* flag, const char* on_help, const char* off_help);

  template <typename NameSeq2, typename AbbrevSeq2>
  auto add(const options_description<NameSeq2, AbbrevSeq2>& other);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return *all_; }
  base_t& get() { return *all_; }

 private:
  using base_ptr_t = std::shared_ptr<base_t>;

  options_description(base_ptr_t all, base_ptr_t visible)
      : all_(std::move(all)), visible_(std::move(visible)) {}

  template <util::StringLiteral Name, char Abbrev>
  static std::string option_spec();

  template <util::StringLiteral Name, char Abbrev = ' '>
  auto with_name() const;

  template <typename, typename>
  friend class options_description;

  base_ptr_t all_;
  base_ptr_t visible_;
};

// Parses ts (argc/argv or a vector of tokens, as boost's command_line_parser accepts) against desc,
// which may be a boost or a boost_util options_description. A boost parse error becomes a
// util::CleanException.
template <typename Desc, typename... Ts>
boost::program_options::variables_map parse_args(const Desc& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
