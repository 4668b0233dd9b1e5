#pragma once

/** \file shallow_clone.hpp
 *  \brief Marks types whose copy shares structure instead of deep-copying.
 *
 * A type opts in by declaring `static constexpr bool shallow_clonable = true;`.
 * Copying such a type is O(1) (or proportional to the number of groups for
 * low-cardinality composites wrapped in MarkShallow).
 */

#include <type_traits>

namespace tessera {

template <class T, class = void>
struct is_shallow_clone : std::false_type {};

template <class T>
struct is_shallow_clone<T, std::void_t<decltype(T::shallow_clonable)>>
    : std::bool_constant<T::shallow_clonable> {};

template <class T>
inline constexpr bool is_shallow_clone_v = is_shallow_clone<T>::value;

/** \brief Copy a value known to share structure with its source. */
template <class T>
[[nodiscard]] auto shallow_clone(const T& value) -> T {
    static_assert(is_shallow_clone_v<T>, "type does not support shallow cloning");
    return value;
}

} // namespace tessera
