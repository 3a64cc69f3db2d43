#include "config_file.hpp"

#include <tessera/util/inline.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <sstream>

namespace app {

std::string ConfigLoadResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::FileNotFound:
        return fmt::format("Configuration file not found: {}", std::get<std::filesystem::path>(value));
    case Type::TOMLParseError: //
    {
        auto &error = std::get<toml::parse_error>(value);
        std::ostringstream ss{};
        ss << error.source();
        return fmt::format("TOML parse error: {} (at {})", error.description(), ss.str());
    }
    case Type::UnsupportedConfigVersion:
        return fmt::format("Unsupported configuration version: {}", std::get<int>(value));
    default: return "Unspecified error";
    }
}

template <typename T>
FORCE_INLINE static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    if (auto opt = node[name].value<T>()) {
        value = *opt;
    }
}

ConfigLoadResult LoadConfigFile(const std::filesystem::path &path, tessera::core::Configuration &config) {
    if (!std::filesystem::is_regular_file(path)) {
        return ConfigLoadResult::FileNotFound(path);
    }

    auto parseResult = toml::parse_file(path.native());
    if (parseResult.failed()) {
        return ConfigLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    int configVersion = kConfigVersion;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return ConfigLoadResult::UnsupportedConfigVersion(configVersion);
    }

    if (auto tblTransport = data["Transport"]) {
        auto &transport = config.transport;
        Parse(tblTransport, "UserAgent", transport.userAgent);
        Parse(tblTransport, "ConnectTimeoutMs", transport.connectTimeoutMs);
        Parse(tblTransport, "FollowRedirects", transport.followRedirects);
        Parse(tblTransport, "MaxRedirects", transport.maxRedirects);
        Parse(tblTransport, "Verbose", transport.verbose);
    }

    if (auto tblFiles = data["Files"]) {
        Parse(tblFiles, "MemoryMap", config.files.memoryMap);
    }

    return ConfigLoadResult::Success();
}

} // namespace app
