#pragma once

/**
@file
@brief Defines `tessera::core::Configuration` for configuring stream handles and transports.
*/

#include <tessera/core/types.hpp>

#include <string>

namespace tessera::core {

/// @brief Tessera runtime configuration.
///
/// The configuration is read when a handle registry is built. Changing it afterwards does not affect registries or
/// handles that already exist.
struct Configuration {
    /// @brief Network transport configuration.
    struct Transport {
        /// @brief The User-Agent header sent with HTTP requests.
        std::string userAgent = "tessera/" Tessera_VERSION;

        /// @brief Maximum time allowed to establish a connection, in milliseconds.
        ///
        /// Zero uses the transport's default.
        uint32 connectTimeoutMs = 30000;

        /// @brief Follow HTTP redirects.
        bool followRedirects = true;

        /// @brief Maximum number of redirects to follow when `followRedirects` is enabled.
        uint32 maxRedirects = 8;

        /// @brief Print transport-level diagnostics to `stderr`.
        bool verbose = false;
    } transport;

    /// @brief Local file access configuration.
    struct Files {
        /// @brief Memory-map `file:` resources instead of streaming them through a file stream.
        bool memoryMap = false;
    } files;
};

} // namespace tessera::core
