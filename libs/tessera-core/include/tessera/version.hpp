#pragma once

/**
@file
@brief Tessera library version definitions.
*/

namespace tessera::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = Tessera_VERSION;

inline constexpr auto major = static_cast<unsigned>(Tessera_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(Tessera_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(Tessera_VERSION_PATCH); ///< The library's patch version

} // namespace tessera::version
