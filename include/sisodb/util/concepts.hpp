#pragma once

#include <concepts>
#include <type_traits>


namespace siso {

/** Integral types usable as numeric command line arguments.  `bool` is excluded; flags are handled separately. */
template<typename T>
concept integral = std::integral<T> and not std::same_as<T, bool>;

template<typename T>
concept unsigned_integral = integral<T> and std::is_unsigned_v<T>;

/** A callback that accepts a parsed argument of type \tparam T. */
template<typename Callback, typename T>
concept is_invocable = std::is_invocable_v<Callback, T>;

}
