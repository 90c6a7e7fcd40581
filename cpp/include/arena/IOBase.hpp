#pragma once

#include <string>

namespace arena {

/*
 * Default implementations for Game::IO methods. Game::IO classes can inherit from this and
 * override as needed.
 */
struct IOBase {
  template <typename Outcome>
  static std::string outcome_to_str(const Outcome& outcome) {
    return outcome.to_str();
  }
};

}  // namespace arena
