#include <catch2/catch_test_macros.hpp>

#include <tessera/io/byte_source/byte_source_mem.hpp>
#include <tessera/io/handle_registry.hpp>
#include <tessera/io/stream_error.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace tessera;

namespace handle_registry {

TEST_CASE("File locators are translated to local paths", "[io][registry]") {
    CHECK(io::FileLocatorToPath("file:///data/cells/0.raw") == std::filesystem::path{"/data/cells/0.raw"});
    CHECK(io::FileLocatorToPath("file://localhost/data/0.raw") == std::filesystem::path{"/data/0.raw"});
    CHECK(io::FileLocatorToPath("file:relative/0.raw") == std::filesystem::path{"relative/0.raw"});
    CHECK(io::FileLocatorToPath("file:///with%20space.raw") == std::filesystem::path{"/with space.raw"});

    CHECK_FALSE(io::FileLocatorToPath("file://otherhost/data/0.raw").has_value());
    CHECK_FALSE(io::FileLocatorToPath("file:").has_value());
    CHECK_FALSE(io::FileLocatorToPath("file:///bad%2").has_value());
    CHECK_FALSE(io::FileLocatorToPath("file:///bad%zz").has_value());
    CHECK_FALSE(io::FileLocatorToPath("http://example.com/0.raw").has_value());
}

TEST_CASE("Default registry dispatches by scheme", "[io][registry]") {
    core::Configuration config{};
    const auto registry = io::MakeDefaultRegistry(config);

    CHECK(registry.Schemes() == std::vector<std::string>{"http:", "file:"});
    CHECK(registry.IsConstructable("http://example.com/cells/0.raw"));
    CHECK(registry.IsConstructable("file:///data/0.raw"));
    CHECK_FALSE(registry.IsConstructable("ftp://example.com/x"));
    CHECK_FALSE(registry.IsConstructable("s3://bucket/key"));

    SECTION("unsupported schemes are rejected") {
        std::error_code error{};
        auto handle = registry.Open("ftp://example.com/x", error);
        CHECK(handle == nullptr);
        CHECK(error == io::StreamError::UnsupportedLocator);
    }

    SECTION("file locators from remote hosts are rejected") {
        std::error_code error{};
        auto handle = registry.Open("file://otherhost/x", error);
        CHECK(handle == nullptr);
        CHECK(error == io::StreamError::UnsupportedLocator);
    }
}

TEST_CASE("Default registry opens local files", "[io][registry]") {
    const auto path = std::filesystem::temp_directory_path() / "tessera-registry-test.bin";
    std::vector<uint8> data(4096);
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<uint8>(i * 7);
    }
    {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<const char *>(data.data()), data.size());
    }

    core::Configuration config{};

    SECTION("through a file stream") {
        config.files.memoryMap = false;
    }

    SECTION("through a memory mapping") {
        config.files.memoryMap = true;
    }

    const auto registry = io::MakeDefaultRegistry(config);
    std::error_code error{};
    auto handle = registry.Open("file://" + path.generic_string(), error);
    REQUIRE_FALSE(error);
    REQUIRE(handle != nullptr);
    CHECK(handle->IsOpen());
    CHECK(handle->Position() == 0);
    CHECK(handle->Length() == data.size());

    handle->Seek(1000, error);
    REQUIRE_FALSE(error);
    std::vector<uint8> buf(16);
    handle->ReadFully(buf, error);
    CHECK_FALSE(error);
    CHECK(std::equal(buf.begin(), buf.end(), data.begin() + 1000));

    SECTION("missing files fail to open") {
        auto missing = registry.Open("file://" + path.generic_string() + ".missing", error);
        CHECK(missing == nullptr);
        CHECK(error == io::StreamError::TransportError);
    }

    handle.reset();
    std::filesystem::remove(path, error);
}

TEST_CASE("Custom schemes can be registered", "[io][registry]") {
    io::HandleRegistry registry{};
    CHECK(registry.Schemes().empty());

    uint32 factoryCalls = 0;
    registry.Register("mem:", [&](std::string_view locator) -> std::unique_ptr<io::IByteSource> {
        ++factoryCalls;
        if (locator == "mem:hello") {
            const std::vector<uint8> hello{'h', 'e', 'l', 'l', 'o'};
            return std::make_unique<io::MemoryByteSource>(hello);
        }
        return nullptr;
    });

    CHECK(registry.IsConstructable("mem:hello"));
    CHECK(factoryCalls == 0);

    std::error_code error{};
    auto handle = registry.Open("mem:hello", error);
    REQUIRE_FALSE(error);
    REQUIRE(handle != nullptr);
    CHECK(handle->Locator() == "mem:hello");
    CHECK(handle->Length() == 5);
    CHECK(handle->ReadUnsigned<uint8>(true, error) == 'h');

    // The factory may refuse locators within its scheme
    auto refused = registry.Open("mem:other", error);
    CHECK(refused == nullptr);
    CHECK(error == io::StreamError::UnsupportedLocator);
    CHECK(factoryCalls == 2);
}

} // namespace handle_registry
