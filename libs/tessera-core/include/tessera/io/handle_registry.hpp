#pragma once

/**
@file
@brief Defines `tessera::io::HandleRegistry`, which maps locator schemes to byte source implementations.
*/

#include <tessera/core/configuration.hpp>

#include <tessera/io/byte_source/byte_source.hpp>
#include <tessera/io/stream_handle.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tessera::io {

/// @brief Builds a byte source for a locator.
///
/// Returns `nullptr` if the locator carries the right scheme but is otherwise malformed.
using ByteSourceFactory = std::function<std::unique_ptr<IByteSource>(std::string_view locator)>;

/// @brief Maps locator scheme prefixes (such as `http:`) to byte source factories.
///
/// Registries are filled explicitly, usually once at process start with `MakeDefaultRegistry`. Prefixes are matched
/// case-sensitively in registration order; the first match wins.
class HandleRegistry {
public:
    /// @brief Registers a factory for locators starting with `schemePrefix`.
    void Register(std::string schemePrefix, ByteSourceFactory factory);

    /// @brief Determines if any registered scheme accepts the locator.
    [[nodiscard]] bool IsConstructable(std::string_view locator) const;

    /// @brief Builds and opens a stream handle for the locator.
    ///
    /// Fails with `StreamError::UnsupportedLocator` if no registered scheme accepts the locator or the matching
    /// factory rejects it. Connection failures are reported as returned by `StreamHandle::Open`.
    ///
    /// @param[in] locator the resource locator
    /// @param[out] error receives the failure, if any
    /// @return the open handle, or `nullptr` on failure
    std::unique_ptr<StreamHandle> Open(std::string_view locator, std::error_code &error) const;

    /// @brief Lists the registered scheme prefixes in registration order.
    [[nodiscard]] std::vector<std::string> Schemes() const;

private:
    struct Entry {
        std::string schemePrefix;
        ByteSourceFactory factory;
    };

    std::vector<Entry> m_entries;

    const Entry *Find(std::string_view locator) const;
};

/// @brief Creates a registry with the built-in schemes.
///
/// - `http:` locators are streamed with libcurl.
/// - `file:` locators are read from the local filesystem, memory-mapped if `config.files.memoryMap` is set.
///
/// @param[in] config the configuration applied to every byte source built by the registry
HandleRegistry MakeDefaultRegistry(const core::Configuration &config);

/// @brief Converts a `file:` locator into a filesystem path.
///
/// Accepts `file:///absolute/path`, `file://localhost/absolute/path` and `file:relative/path`. Percent-encoded bytes
/// are decoded.
///
/// @return the path, or `std::nullopt` if the locator is not a valid local `file:` locator
std::optional<std::filesystem::path> FileLocatorToPath(std::string_view locator);

} // namespace tessera::io
