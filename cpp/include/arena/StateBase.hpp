#pragma once

#include <compare>

namespace arena {

/*
 * CRTP base for State classes. Provides next() in terms of the derived class's make_next():
 *
 * struct State : public arena::StateBase<State, Action> {
 *   void make_next(Action);
 *   ...
 * };
 */
template <typename Derived, typename Action>
struct StateBase {
  Derived next(Action action) const {
    Derived out = static_cast<const Derived&>(*this);
    out.make_next(action);
    return out;
  }

  // Lets derived states default their own comparison operators.
  auto operator<=>(const StateBase&) const = default;
};

}  // namespace arena
