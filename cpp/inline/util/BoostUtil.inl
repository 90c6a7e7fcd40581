#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <fmt/format.h>

namespace boost_util {

namespace program_options {

template <typename NameSeq, typename AbbrevSeq>
options_description<NameSeq, AbbrevSeq>::options_description(const char* name)
    : all_(std::make_shared<base_t>(name, util::get_screen_width() - 1)),
      visible_(std::make_shared<base_t>(name, util::get_screen_width() - 1)) {}

template <typename NameSeq, typename AbbrevSeq>
template <util::StringLiteral Name, char Abbrev>
std::string options_description<NameSeq, AbbrevSeq>::option_spec() {
  if constexpr (Abbrev == ' ') {
    return Name.value;
  } else {
    return fmt::format("{},{}", Name.value, Abbrev);
  }
}

template <typename NameSeq, typename AbbrevSeq>
template <util::StringLiteral Name, char Abbrev>
auto options_description<NameSeq, AbbrevSeq>::with_name() const {
  static_assert(!util::contains_string_v<NameSeq, Name>, "Duplicate option name");

  if constexpr (Abbrev == ' ') {
    using Out = options_description<util::concat_t<NameSeq, util::StringLiteralSequence<Name>>,
                                    AbbrevSeq>;
    return Out(all_, visible_);
  } else {
    static_assert(!util::contains_char_v<AbbrevSeq, Abbrev>, "Duplicate option abbreviation");
    using Out = options_description<util::concat_t<NameSeq, util::StringLiteralSequence<Name>>,
                                    util::concat_t<AbbrevSeq, util::char_sequence<Abbrev>>>;
    return Out(all_, visible_);
  }
}

// boost wraps the value_semantic pointer of an option in a shared_ptr, so an option is built once
// and the resulting option_description is shared by both boost descriptions.
template <typename NameSeq, typename AbbrevSeq>
template <util::StringLiteral Name, char Abbrev, typename... Ts>
auto options_description<NameSeq, AbbrevSeq>::add_option(Ts&&... ts) {
  auto out = with_name<Name, Abbrev>();
  std::string spec = option_spec<Name, Abbrev>();

  base_t scratch;
  scratch.add_options()(spec.c_str(), std::forward<Ts>(ts)...);
  out.all_->add(scratch.options().front());
  out.visible_->add(scratch.options().front());
  return out;
}

template <typename NameSeq, typename AbbrevSeq>
template <util::StringLiteral Name, typename... Ts>
auto options_description<NameSeq, AbbrevSeq>::add_hidden_option(Ts&&... ts) {
  auto out = with_name<Name>();
  std::string spec = option_spec<Name, ' '>();
  out.all_->add_options()(spec.c_str(), std::forward<Ts>(ts)...);
  return out;
}

template <typename NameSeq, typename AbbrevSeq>
template <util::StringLiteral OnName, util::StringLiteral OffName>
auto options_description<NameSeq, AbbrevSeq>::add_flag(bool* flag, const char* on_help,
                                                      const char* off_help) {
  namespace po = boost::program_options;

  auto out = with_name<OnName>().template with_name<OffName>();

  // The switch matching the current value does nothing; say so in the help text.
  std::string on_text = fmt::format("{}{}", on_help, *flag ? " (no-op)" : "");
  std::string off_text = fmt::format("{}{}", off_help, *flag ? "" : " (no-op)");

  base_t scratch;
  scratch.add_options()(OnName.value, po::value(flag)->implicit_value(true)->zero_tokens(),
                        on_text.c_str())(
    OffName.value, po::value(flag)->implicit_value(false)->zero_tokens(), off_text.c_str());

  const auto& on_option = scratch.options()[0];
  const auto& off_option = scratch.options()[1];
  out.all_->add(on_option);
  out.all_->add(off_option);
  out.visible_->add(*flag ? off_option : on_option);
  return out;
}

template <typename NameSeq, typename AbbrevSeq>
template <typename NameSeq2, typename AbbrevSeq2>
auto options_description<NameSeq, AbbrevSeq>::add(
  const options_description<NameSeq2, AbbrevSeq2>& other) {
  static_assert(util::disjoint_v<NameSeq, NameSeq2>, "Duplicate option name");
  static_assert(util::disjoint_v<AbbrevSeq, AbbrevSeq2>, "Duplicate option abbreviation");

  all_->add(*other.all_);
  visible_->add(*other.visible_);

  using Out =
    options_description<util::concat_t<NameSeq, NameSeq2>, util::concat_t<AbbrevSeq, AbbrevSeq2>>;
  return Out(all_, visible_);
}

template <typename NameSeq, typename AbbrevSeq>
void options_description<NameSeq, AbbrevSeq>::print(std::ostream& s) const {
  (Settings::help_full ? all_ : visible_)->print(s);
}

namespace detail {

inline const boost::program_options::options_description& as_boost(
  const boost::program_options::options_description& desc) {
  return desc;
}

template <typename NameSeq, typename AbbrevSeq>
const boost::program_options::options_description& as_boost(
  const options_description<NameSeq, AbbrevSeq>& desc) {
  return desc.get();
}

}  // namespace detail

template <typename Desc, typename... Ts>
boost::program_options::variables_map parse_args(const Desc& desc, Ts&&... ts) {
  namespace po = boost::program_options;

  po::variables_map vm;
  try {
    po::store(
      po::command_line_parser(std::forward<Ts>(ts)...).options(detail::as_boost(desc)).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
