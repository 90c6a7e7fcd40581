#pragma once

#include <algorithm>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

#define XSTR(a) STR(a)
#define STR(a) #a

// Constant-expression test for a macro defined as 1, as cmake's -DFOO=1 does. An undefined macro
// stringizes to its own name and so tests false.
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')

// Mentions its arguments without evaluating them. Lets a compiled-out log statement keep its
// variables "used".
#define USE_UNEVALUATED(...) ((void)sizeof(std::forward_as_tuple(__VA_ARGS__)))

namespace util {

// Declared, never defined: only for unevaluated operands. In a concept,
//
//   { util::decay_copy(G::kName) } -> std::same_as<const char*>;
//
// requires G to have a static member kName of that type.
template <class T>
std::decay_t<T> decay_copy(T&&);

// A string literal that can be passed as a template argument: f<"name">().
template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }

  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    if constexpr (N != M) {
      return false;
    } else {
      return std::equal(value, value + N, other.value);
    }
  }

  char value[N];
};

// Type-level lists of option names and of one-character option abbreviations. BoostUtil threads
// them through its options_description type so that a repeated name fails to compile.
template <StringLiteral... Strs>
struct StringLiteralSequence {};

template <char... Chars>
using char_sequence = std::integer_sequence<char, Chars...>;

template <typename Seq, StringLiteral S>
inline constexpr bool contains_string_v = false;

template <StringLiteral... Strs, StringLiteral S>
inline constexpr bool contains_string_v<StringLiteralSequence<Strs...>, S> = ((Strs == S) || ...);

template <typename Seq, char C>
inline constexpr bool contains_char_v = false;

template <char... Chars, char C>
inline constexpr bool contains_char_v<char_sequence<Chars...>, C> = ((Chars == C) || ...);

template <typename Seq1, typename Seq2>
struct concat;

template <StringLiteral... Strs1, StringLiteral... Strs2>
struct concat<StringLiteralSequence<Strs1...>, StringLiteralSequence<Strs2...>> {
  using type = StringLiteralSequence<Strs1..., Strs2...>;
};

template <char... Chars1, char... Chars2>
struct concat<char_sequence<Chars1...>, char_sequence<Chars2...>> {
  using type = char_sequence<Chars1..., Chars2...>;
};

template <typename Seq1, typename Seq2>
using concat_t = typename concat<Seq1, Seq2>::type;

// True when no element of Seq2 appears in Seq1.
template <typename Seq1, typename Seq2>
inline constexpr bool disjoint_v = true;

template <typename Seq1, StringLiteral... Strs>
inline constexpr bool disjoint_v<Seq1, StringLiteralSequence<Strs...>> =
  (!contains_string_v<Seq1, Strs> && ...);

template <typename Seq1, char... Chars>
inline constexpr bool disjoint_v<Seq1, char_sequence<Chars...>> =
  (!contains_char_v<Seq1, Chars> && ...);

}  // namespace util
