#pragma once

/**
@file
@brief Utilities for dealing with memory blocks, including endianness-aware reads and writes.
*/

#include <tessera/core/types.hpp>

#include "bit_ops.hpp"
#include "inline.hpp"

#include <bit>
#include <concepts>
#include <cstring>
#include <span>

namespace util {

/// @brief Reads a big-endian integer from the given pointer.
///
/// The pointer does not need to be aligned to `T`.
///
/// @tparam T the integer type
/// @param[in] data the pointer to the data to read
/// @return the value at `data` reinterpreted as a big-endian integer of type `T`
template <std::unsigned_integral T>
[[nodiscard]] FORCE_INLINE T ReadBE(const void *data) {
    T value;
    std::memcpy(&value, data, sizeof(T));
    return bit::big_endian_swap(value);
}

/// @brief Write a big-endian integer to the given pointer.
/// @tparam T the integer type
/// @param[out] data the pointer to the data to write
/// @param[in] value the value to write at `data` in big-endian order
template <std::unsigned_integral T>
FORCE_INLINE void WriteBE(void *data, T value) {
    value = bit::big_endian_swap(value);
    std::memcpy(data, &value, sizeof(T));
}

/// @brief Reads a little-endian integer from the given pointer.
///
/// The pointer does not need to be aligned to `T`.
///
/// @tparam T the integer type
/// @param[in] data the pointer to the data to read
/// @return the value at `data` reinterpreted as a little-endian integer of type `T`
template <std::unsigned_integral T>
[[nodiscard]] FORCE_INLINE T ReadLE(const void *data) {
    T value;
    std::memcpy(&value, data, sizeof(T));
    return bit::little_endian_swap(value);
}

/// @brief Write a little-endian integer to the given pointer.
/// @tparam T the integer type
/// @param[out] data the pointer to the data to write
/// @param[in] value the value to write at `data` in little-endian order
template <std::unsigned_integral T>
FORCE_INLINE void WriteLE(void *data, T value) {
    value = bit::little_endian_swap(value);
    std::memcpy(data, &value, sizeof(T));
}

/// @brief Assembles an unsigned integer from a run of 1 to 8 bytes in the given byte order.
///
/// Runs shorter than 8 bytes are zero-extended. Bytes past the eighth are ignored.
///
/// @param[in] bytes the bytes to assemble
/// @param[in] littleEndian whether the least significant byte comes first
/// @return the assembled value
[[nodiscard]] FORCE_INLINE uint64 ReadUnsigned(std::span<const uint8> bytes, bool littleEndian) noexcept {
    const size_t count = bytes.size() < sizeof(uint64) ? bytes.size() : sizeof(uint64);
    uint64 value = 0;
    for (size_t i = 0; i < count; i++) {
        const uint64 byte = littleEndian ? bytes[count - 1 - i] : bytes[i];
        value = (value << 8ull) | byte;
    }
    return value;
}

} // namespace util
