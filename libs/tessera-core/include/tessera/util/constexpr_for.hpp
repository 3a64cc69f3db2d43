#pragma once

/**
@file
@brief Compile-time `for` loop construct.
*/

#include <cstddef>
#include <utility>

namespace util {

namespace detail {

    template <typename F, std::size_t... S>
    inline constexpr void constexpr_for_impl(F &&function, std::index_sequence<S...>) {
        (function(std::integral_constant<std::size_t, S>{}), ...);
    }

} // namespace detail

/// @brief Invokes the function once per index in `[0, iterations)`.
///
/// The function receives the index as a `std::integral_constant`, so it can be used as a template argument:
///
/// ```cpp
/// util::constexpr_for<std::variant_size_v<V>>([&](auto index) {
///     if (wanted == index) {
///         variant.template emplace<decltype(index)::value>();
///     }
/// });
/// ```
template <std::size_t iterations, typename F>
inline constexpr void constexpr_for(F &&function) {
    detail::constexpr_for_impl(std::forward<F>(function), std::make_index_sequence<iterations>());
}

} // namespace util
