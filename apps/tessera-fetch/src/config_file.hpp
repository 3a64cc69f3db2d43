#pragma once

#include <tessera/core/configuration.hpp>

#include <toml++/toml.hpp>

#include <filesystem>
#include <string>
#include <variant>

namespace app {

inline constexpr int kConfigVersion = 1;

struct ConfigLoadResult {
    enum class Type { Success, FileNotFound, TOMLParseError, UnsupportedConfigVersion };

    static ConfigLoadResult Success() {
        return {.type = Type::Success};
    }

    static ConfigLoadResult FileNotFound(std::filesystem::path path) {
        return {.type = Type::FileNotFound, .value = std::move(path)};
    }

    static ConfigLoadResult TOMLParseError(toml::parse_error error) {
        return {.type = Type::TOMLParseError, .value = error};
    }

    static ConfigLoadResult UnsupportedConfigVersion(int version) {
        return {.type = Type::UnsupportedConfigVersion, .value = version};
    }

    operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;

    Type type;
    std::variant<std::monostate, std::filesystem::path, toml::parse_error, int> value;
};

// Loads configuration overrides from a TOML file into `config`.
// Keys missing from the file leave the corresponding settings untouched.
//
// Example:
//
//   ConfigVersion = 1
//
//   [Transport]
//   UserAgent = "tessera-fetch"
//   ConnectTimeoutMs = 10000
//   FollowRedirects = true
//   MaxRedirects = 4
//   Verbose = false
//
//   [Files]
//   MemoryMap = true
ConfigLoadResult LoadConfigFile(const std::filesystem::path &path, tessera::core::Configuration &config);

} // namespace app
