#pragma once

#include <concepts>
#include <random>

/*
 * Process-wide PRNG used by the random agents.
 *
 * It is time-seeded unless a nonzero --seed is passed (see Params), in which case every run with
 * the same agents replays the same games. Tests call set_seed() directly.
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  static void set_seed(int seed);

  // Uniform pick from [lower, upper). Throws util::Exception on an empty range.
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
