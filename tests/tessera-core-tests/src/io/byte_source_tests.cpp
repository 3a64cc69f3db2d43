#include <catch2/catch_test_macros.hpp>

#include <tessera/io/byte_source/byte_source_impl.hpp>
#include <tessera/io/stream_error.hpp>

#include <tessera/core/configuration.hpp>

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <vector>

using namespace tessera;

namespace byte_source {

static std::vector<uint8> MakeData(size_t size) {
    std::vector<uint8> data(size);
    for (size_t i = 0; i < size; i++) {
        data[i] = static_cast<uint8>(i * 31 + (i >> 8));
    }
    return data;
}

// Writes test data into a temporary file that is deleted when the object goes out of scope.
struct TempFile {
    explicit TempFile(std::span<const uint8> data, std::string_view name) {
        path = std::filesystem::temp_directory_path() / name;
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<const char *>(data.data()), data.size());
    }

    ~TempFile() {
        std::error_code error{};
        std::filesystem::remove(path, error);
    }

    std::filesystem::path path;
};

// Drains the source in chunks of `chunkSize` bytes.
static std::vector<uint8> ReadAll(io::IByteSource &source, size_t chunkSize) {
    std::vector<uint8> out{};
    std::vector<uint8> chunk(chunkSize);
    std::error_code error{};
    while (true) {
        const uint64 count = source.Read(chunk, error);
        REQUIRE_FALSE(error);
        if (count == 0) {
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + count);
    }
    return out;
}

// Checks the behavior shared by every source implementation.
static void CheckSource(io::IByteSource &source, const std::vector<uint8> &data) {
    std::error_code error{};

    source.Open(error);
    REQUIRE_FALSE(error);
    CHECK(source.Size() == data.size());
    CHECK(ReadAll(source, 1000) == data);

    // Reopening rewinds to the start
    source.Open(error);
    REQUIRE_FALSE(error);

    CHECK(source.Skip(5000, error) == 5000);
    CHECK_FALSE(error);

    std::vector<uint8> buf(16);
    CHECK(source.Read(buf, error) == 16);
    CHECK_FALSE(error);
    CHECK(std::equal(buf.begin(), buf.end(), data.begin() + 5000));

    // Skipping past the end stops at the end
    const uint64 remaining = data.size() - 5016;
    CHECK(source.Skip(static_cast<uint32>(remaining + 100), error) == remaining);
    CHECK_FALSE(error);
    CHECK(source.Skip(1, error) == 0);
    CHECK(source.Read(buf, error) == 0);
    CHECK_FALSE(error);

    source.Close();
}

TEST_CASE("In-memory sources stream their buffer", "[io][byte_source]") {
    const auto data = MakeData(20'000);
    io::MemoryByteSource source{std::span<const uint8>{data}};
    CheckSource(source, data);

    std::error_code error{};
    uint8 byte = 0;
    CHECK(source.Read({&byte, 1}, error) == 0);
    CHECK(error == io::StreamError::ClosedHandle);
}

TEST_CASE("File sources stream local files", "[io][byte_source]") {
    const auto data = MakeData(100'000);
    TempFile file{data, "tessera-byte-source-file.bin"};

    SECTION("through a file stream") {
        io::FileByteSource source{file.path};
        CheckSource(source, data);
    }

    SECTION("through a memory mapping") {
        io::MemoryMappedByteSource source{file.path};
        CheckSource(source, data);

        std::error_code error{};
        uint8 byte = 0;
        CHECK(source.Read({&byte, 1}, error) == 0);
        CHECK(error == io::StreamError::ClosedHandle);
    }

    SECTION("of zero length") {
        TempFile empty{{}, "tessera-byte-source-empty.bin"};
        io::FileByteSource fileSource{empty.path};
        io::MemoryMappedByteSource mappedSource{empty.path};

        const std::array<io::IByteSource *, 2> sources{&fileSource, &mappedSource};
        for (io::IByteSource *source : sources) {
            std::error_code error{};
            source->Open(error);
            REQUIRE_FALSE(error);
            CHECK(source->Size() == 0u);

            std::vector<uint8> buf(16);
            CHECK(source->Read(buf, error) == 0);
            CHECK_FALSE(error);
            CHECK(source->Skip(10, error) == 0);
            CHECK_FALSE(error);

            // Reopening keeps the source usable
            source->Open(error);
            REQUIRE_FALSE(error);
            CHECK(source->Read(buf, error) == 0);
            CHECK_FALSE(error);
            source->Close();
        }
    }
}

TEST_CASE("File sources report missing files", "[io][byte_source]") {
    const auto path = std::filesystem::temp_directory_path() / "tessera-this-file-does-not-exist.bin";
    std::error_code error{};

    SECTION("through a file stream") {
        io::FileByteSource source{path};
        source.Open(error);
    }

    SECTION("through a memory mapping") {
        io::MemoryMappedByteSource source{path};
        source.Open(error);
    }

    CHECK(error == io::StreamError::TransportError);
}

TEST_CASE("URL sources stream through libcurl", "[io][byte_source][curl]") {
    // A file:// URL exercises the whole transfer machinery without a network server.
    // The data is larger than the pending buffer limit so that the transfer has to pause and resume.
    const auto data = MakeData(1'000'000);
    TempFile file{data, "tessera-byte-source-url.bin"};

    core::Configuration config{};
    const std::string url = "file://" + file.path.generic_string();

    SECTION("reads the whole resource") {
        io::UrlByteSource source{url, config.transport};
        std::error_code error{};
        source.Open(error);
        REQUIRE_FALSE(error);
        CHECK(ReadAll(source, 64 * 1024) == data);

        SECTION("and starts over when reopened") {
            source.Open(error);
            REQUIRE_FALSE(error);
            std::vector<uint8> buf(100);
            CHECK(source.Read(buf, error) == 100);
            CHECK(std::equal(buf.begin(), buf.end(), data.begin()));
        }
    }

    SECTION("skips by reading ahead") {
        io::UrlByteSource source{url, config.transport};
        std::error_code error{};
        source.Open(error);
        REQUIRE_FALSE(error);

        CHECK(source.Skip(700'000, error) == 700'000);
        std::vector<uint8> buf(64);
        CHECK(source.Read(buf, error) == 64);
        CHECK(std::equal(buf.begin(), buf.end(), data.begin() + 700'000));
    }

    SECTION("fails on missing resources") {
        io::UrlByteSource source{url + ".missing", config.transport};
        std::error_code error{};
        source.Open(error);
        CHECK(error == io::StreamError::TransportError);
    }
}

} // namespace byte_source
