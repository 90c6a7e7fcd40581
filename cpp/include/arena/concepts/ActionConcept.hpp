#pragma once

#include <concepts>
#include <type_traits>

namespace arena {
namespace concepts {

/*
 * An Action is one move proposed against a State. The engine never inspects its payload; it only
 * copies it from an Agent to the State. Equality is not required, but when present, GameRunner
 * uses it to validate that an agent picked one of the offered actions.
 */
template <class A>
concept Action = std::copyable<A> && std::is_trivially_copyable_v<A>;

}  // namespace concepts
}  // namespace arena
