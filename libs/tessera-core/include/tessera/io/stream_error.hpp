#pragma once

/**
@file
@brief Error codes reported by stream handles, byte sources and the handle registry.
*/

#include <system_error>
#include <type_traits>

namespace tessera::io {

/// @brief Stream error codes.
///
/// Values compare directly against `std::error_code` through the `std::is_error_code_enum` specialization below.
enum class StreamError {
    /// @brief The locator does not match any supported scheme.
    ///
    /// This is recoverable: the caller may try another handle implementation.
    UnsupportedLocator = 1,

    /// @brief The seek target is negative or past the known length of the resource.
    ///
    /// The handle's position and mark are left untouched.
    SeekOutOfRange,

    /// @brief The underlying transport failed: connection refused or reset, timeout, HTTP error status, etc.
    ///
    /// Transport errors are never retried.
    TransportError,

    /// @brief The operation was attempted on a closed handle.
    ClosedHandle,

    /// @brief The resource ended before a read that required an exact number of bytes could complete.
    UnexpectedEndOfStream,
};

/// @brief Retrieves the error category for `StreamError` values.
const std::error_category &StreamErrorCategory() noexcept;

/// @brief Builds an `std::error_code` from a `StreamError`.
/// @param[in] error the error value
/// @return an error code in the `StreamErrorCategory()` category
std::error_code make_error_code(StreamError error) noexcept;

} // namespace tessera::io

template <>
struct std::is_error_code_enum<tessera::io::StreamError> : std::true_type {};
