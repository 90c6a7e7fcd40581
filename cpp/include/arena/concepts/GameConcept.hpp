#pragma once

#include "arena/concepts/ActionConcept.hpp"
#include "arena/concepts/GameIOConcept.hpp"
#include "arena/concepts/OutcomeConcept.hpp"
#include "arena/concepts/StateConcept.hpp"
#include "util/CppUtil.hpp"

#include <concepts>

namespace arena {

namespace concepts {

/*
 * All Game classes G must satisfy arena::concepts::Game<G>.
 *
 * A Game is a compile-time binding of one State type, one Action type and one Outcome type, plus
 * the IO helpers used for logging and terminal play. It is never instantiated. AbstractAgent and
 * GameRunner are written once against this concept.
 */
template <class G>
concept Game = requires {
  { util::decay_copy(G::Constants::kGameName) } -> std::same_as<const char*>;

  requires arena::concepts::Action<typename G::Action>;
  requires arena::concepts::Outcome<typename G::Outcome>;
  requires arena::concepts::State<typename G::State, typename G::Action, typename G::Outcome>;
  requires arena::concepts::GameIO<typename G::IO, typename G::State, typename G::Action,
                                   typename G::Outcome>;
};

}  // namespace concepts

}  // namespace arena
