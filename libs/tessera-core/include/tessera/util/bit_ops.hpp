#pragma once

#include <tessera/core/types.hpp>

#include <bit>
#include <climits>
#include <concepts>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace bit {

namespace detail {

    template <class T, std::size_t... N>
    constexpr T byte_swap_impl(T value, std::index_sequence<N...>) {
        return ((((value >> (N * CHAR_BIT)) & (T)(unsigned char)(-1)) << ((sizeof(T) - 1 - N) * CHAR_BIT)) | ...);
    };

} // namespace detail

// Byte swaps the given value
template <std::unsigned_integral T>
constexpr T byte_swap(T value) {
    return detail::byte_swap_impl<T>(value, std::make_index_sequence<sizeof(T)>{});
}

// Byte swaps the given value if the endianness doesn't match native endianness
template <std::endian endianness, std::unsigned_integral T>
constexpr T endian_swap(T value) {
    if constexpr (endianness == std::endian::native) {
        return value;
    } else {
        return byte_swap(value);
    }
}

// Byte swaps the given value if the native endianness is not big-endian
template <std::unsigned_integral T>
constexpr T big_endian_swap(T value) {
    return endian_swap<std::endian::big>(value);
}

// Byte swaps the given value if the native endianness is not little-endian
template <std::unsigned_integral T>
constexpr T little_endian_swap(T value) {
    return endian_swap<std::endian::little>(value);
}

} // namespace bit
