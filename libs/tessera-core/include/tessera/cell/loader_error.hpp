#pragma once

/**
@file
@brief Error codes reported by typed array conversions.
*/

#include <system_error>
#include <type_traits>

namespace tessera::cell {

/// @brief Conversion error codes.
///
/// Every conversion failure is detected before the first element is written, so a failed conversion leaves the
/// destination untouched.
enum class LoaderError {
    /// @brief The bit depth is zero, not a whole number of bytes, or does not fit the destination element type.
    UnsupportedBitDepth = 1,

    /// @brief The raw byte count is not a multiple of the element size.
    TruncatedPlane,

    /// @brief The plane does not fit in the destination array at the computed offset.
    DestinationTooSmall,

    /// @brief The destination array holds a different element type than the loader produces.
    ElementTypeMismatch,
};

/// @brief Retrieves the error category for `LoaderError` values.
const std::error_category &LoaderErrorCategory() noexcept;

/// @brief Builds an `std::error_code` from a `LoaderError`.
std::error_code make_error_code(LoaderError error) noexcept;

} // namespace tessera::cell

template <>
struct std::is_error_code_enum<tessera::cell::LoaderError> : std::true_type {};
