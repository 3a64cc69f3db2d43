#pragma once

/**
@file
@brief Conversion of raw plane bytes into typed element arrays.
*/

#include "element_type.hpp"
#include "loader_error.hpp"
#include "typed_array.hpp"

#include <tessera/util/data_ops.hpp>

#include <bit>
#include <concepts>
#include <limits>
#include <span>
#include <system_error>
#include <type_traits>
#include <variant>

namespace tessera::cell {

/// @brief Decodes one element from a run of bytes.
///
/// Integer elements are assembled from `bytes` and zero-extended when the run is narrower than `T`. Floating-point
/// elements reinterpret the bits of a run that must be exactly `sizeof(T)` bytes long.
///
/// @tparam T the element type
/// @param[in] bytes the encoded element
/// @param[in] littleEndian whether the least significant byte comes first
template <Element T>
[[nodiscard]] FORCE_INLINE T DecodeElement(std::span<const uint8> bytes, bool littleEndian) {
    const uint64 raw = util::ReadUnsigned(bytes, littleEndian);
    if constexpr (std::floating_point<T>) {
        using U = std::conditional_t<sizeof(T) == sizeof(uint32), uint32, uint64>;
        return std::bit_cast<T>(static_cast<U>(raw));
    } else {
        return static_cast<T>(static_cast<std::make_unsigned_t<T>>(raw));
    }
}

/// @brief Determines if planes stored with `bitsPerPixel` bits per element can be decoded into elements of type `T`.
///
/// The bit depth must be a non-zero whole number of bytes. Integer elements accept depths up to their own width;
/// floating-point elements require an exact match.
template <Element T>
[[nodiscard]] constexpr bool IsCompatibleBitDepth(uint32 bitsPerPixel) {
    if (bitsPerPixel == 0 || bitsPerPixel % 8 != 0) {
        return false;
    }
    constexpr uint32 kBits = sizeof(T) * 8;
    if constexpr (std::floating_point<T>) {
        return bitsPerPixel == kBits;
    } else {
        return bitsPerPixel <= kBits;
    }
}

/// @brief Decodes a plane of raw bytes into its slot of the destination array.
///
/// The plane holds `rawBytes.size() / (bitsPerPixel / 8)` elements and is written starting at
/// `planeIndex * elementCount`.
///
/// All checks are performed before the first element is written. On failure the destination is left untouched.
///
/// @tparam T the element type
/// @param[out] destination the array to write into
/// @param[in] rawBytes the encoded plane
/// @param[in] planeIndex the index of the plane within the array
/// @param[in] bitsPerPixel the encoded width of each element
/// @param[in] littleEndian whether elements are stored least significant byte first
/// @param[out] error receives `LoaderError::UnsupportedBitDepth`, `LoaderError::TruncatedPlane` or
/// `LoaderError::DestinationTooSmall` on failure
/// @return the number of elements written
template <Element T>
uint64 ConvertPlane(std::span<T> destination, std::span<const uint8> rawBytes, uint64 planeIndex, uint32 bitsPerPixel,
                    bool littleEndian, std::error_code &error) {
    error.clear();
    if (!IsCompatibleBitDepth<T>(bitsPerPixel)) {
        error = LoaderError::UnsupportedBitDepth;
        return 0;
    }

    const size_t bytesPerElement = bitsPerPixel / 8;
    if (rawBytes.size() % bytesPerElement != 0) {
        error = LoaderError::TruncatedPlane;
        return 0;
    }

    const uint64 count = rawBytes.size() / bytesPerElement;
    if (count == 0) {
        return 0;
    }
    if (planeIndex > (std::numeric_limits<uint64>::max() / count)) {
        error = LoaderError::DestinationTooSmall;
        return 0;
    }
    const uint64 offset = planeIndex * count;
    if (offset > destination.size() || count > destination.size() - offset) {
        error = LoaderError::DestinationTooSmall;
        return 0;
    }

    for (uint64 i = 0; i < count; i++) {
        destination[offset + i] = DecodeElement<T>(rawBytes.subspan(i * bytesPerElement, bytesPerElement), littleEndian);
    }
    return count;
}

/// @brief Decodes a plane of raw bytes into the destination array, whatever element type it holds.
///
/// See `ConvertPlane` for the semantics.
inline uint64 Convert(TypedArray &destination, std::span<const uint8> rawBytes, uint64 planeIndex,
                      uint32 bitsPerPixel, bool littleEndian, std::error_code &error) {
    return std::visit(
        [&](auto &elements) {
            return ConvertPlane(std::span{elements}, rawBytes, planeIndex, bitsPerPixel, littleEndian, error);
        },
        destination);
}

} // namespace tessera::cell
