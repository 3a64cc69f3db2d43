#include <tessera/io/handle_registry.hpp>

#include <tessera/io/byte_source/byte_source_impl.hpp>
#include <tessera/io/stream_error.hpp>

#include "io_devlog.hpp"

#include <algorithm>

namespace tessera::io {

void HandleRegistry::Register(std::string schemePrefix, ByteSourceFactory factory) {
    devlog::debug<grp::registry>("Registered scheme {}", schemePrefix);
    m_entries.push_back({std::move(schemePrefix), std::move(factory)});
}

bool HandleRegistry::IsConstructable(std::string_view locator) const {
    return Find(locator) != nullptr;
}

std::unique_ptr<StreamHandle> HandleRegistry::Open(std::string_view locator, std::error_code &error) const {
    error.clear();

    const Entry *entry = Find(locator);
    if (entry == nullptr) {
        devlog::warn<grp::registry>("No handle accepts {}", locator);
        error = StreamError::UnsupportedLocator;
        return nullptr;
    }

    std::unique_ptr<IByteSource> source = entry->factory(locator);
    if (!source) {
        devlog::warn<grp::registry>("{} is not a valid {} locator", locator, entry->schemePrefix);
        error = StreamError::UnsupportedLocator;
        return nullptr;
    }

    auto handle = std::make_unique<StreamHandle>(std::string{locator}, std::move(source));
    handle->Open(error);
    if (error) {
        return nullptr;
    }
    return handle;
}

std::vector<std::string> HandleRegistry::Schemes() const {
    std::vector<std::string> schemes{};
    for (const auto &entry : m_entries) {
        schemes.push_back(entry.schemePrefix);
    }
    return schemes;
}

const HandleRegistry::Entry *HandleRegistry::Find(std::string_view locator) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const Entry &entry) { return locator.starts_with(entry.schemePrefix); });
    return it != m_entries.end() ? &*it : nullptr;
}

// -----------------------------------------------------------------------------

HandleRegistry MakeDefaultRegistry(const core::Configuration &config) {
    HandleRegistry registry{};

    registry.Register("http:", [transport = config.transport](std::string_view locator) {
        return std::make_unique<UrlByteSource>(std::string{locator}, transport);
    });

    registry.Register("file:", [memoryMap = config.files.memoryMap](
                                   std::string_view locator) -> std::unique_ptr<IByteSource> {
        auto path = FileLocatorToPath(locator);
        if (!path) {
            return nullptr;
        }
        if (memoryMap) {
            return std::make_unique<MemoryMappedByteSource>(std::move(*path));
        }
        return std::make_unique<FileByteSource>(std::move(*path));
    });

    return registry;
}

static std::optional<uint8> HexDigitValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> FileLocatorToPath(std::string_view locator) {
    static constexpr std::string_view kScheme = "file:";
    static constexpr std::string_view kLocalHost = "localhost";

    if (!locator.starts_with(kScheme)) {
        return std::nullopt;
    }
    std::string_view rest = locator.substr(kScheme.size());

    // file://<host>/<path>; only local hosts are accepted
    if (rest.starts_with("//")) {
        rest.remove_prefix(2);
        const size_t slash = rest.find('/');
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        const std::string_view host = rest.substr(0, slash);
        if (!host.empty() && host != kLocalHost) {
            return std::nullopt;
        }
        rest.remove_prefix(slash);
    }
    if (rest.empty()) {
        return std::nullopt;
    }

    std::string decoded{};
    decoded.reserve(rest.size());
    for (size_t i = 0; i < rest.size(); i++) {
        if (rest[i] != '%') {
            decoded.push_back(rest[i]);
            continue;
        }
        if (i + 2 >= rest.size()) {
            return std::nullopt;
        }
        const auto hi = HexDigitValue(rest[i + 1]);
        const auto lo = HexDigitValue(rest[i + 2]);
        if (!hi || !lo) {
            return std::nullopt;
        }
        decoded.push_back(static_cast<char>((*hi << 4) | *lo));
        i += 2;
    }
    return std::filesystem::path{decoded};
}

} // namespace tessera::io
