#include <tessera/tessera.hpp>

#include "config_file.hpp"
#include "output.hpp"

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace tessera;

int main(int argc, char *argv[]) {
    bool showHelp = false;
    bool bigEndian = false;
    bool memoryMap = false;
    bool verbose = false;
    std::string locator{};
    std::string configFile{};
    std::string typeName{};
    uint64 offset = 0;
    uint64 length = 0;
    uint64 rewind = 0;
    uint32 bits = 0;
    uint64 plane = 0;

    cxxopts::Options options("tessera-fetch", "Tessera stream and plane inspection tool\nVersion " Tessera_VERSION);
    options.add_options()("h,help", "Display this help text.", cxxopts::value(showHelp)->default_value("false"));
    options.add_options()("o,offset", "Offset of the first byte to read.", cxxopts::value(offset)->default_value("0"),
                          "bytes");
    options.add_options()("n,length", "Number of bytes to read.", cxxopts::value(length)->default_value("256"),
                          "bytes");
    options.add_options()("r,rewind", "Seek back by this many bytes after reading and read them again.",
                          cxxopts::value(rewind)->default_value("0"), "bytes");
    options.add_options()("t,type", "Decode the bytes as a plane of elements: i8, i16, i32, i64, f32, f64",
                          cxxopts::value(typeName), "type");
    options.add_options()("b,bits", "Bits per pixel of the encoded plane. Defaults to the element width.",
                          cxxopts::value(bits)->default_value("0"), "bits");
    options.add_options()("B,big-endian", "The encoded plane is big-endian.",
                          cxxopts::value(bigEndian)->default_value("false"));
    options.add_options()("p,plane", "Index of the decoded plane within the cell.",
                          cxxopts::value(plane)->default_value("0"), "index");
    options.add_options()("c,config", "Load configuration overrides from a TOML file.", cxxopts::value(configFile),
                          "path");
    options.add_options()("m,mmap", "Memory-map file: resources.", cxxopts::value(memoryMap)->default_value("false"));
    options.add_options()("v,verbose", "Print transport diagnostics.", cxxopts::value(verbose)->default_value("false"));
    options.add_options()("locator", "Resource locator", cxxopts::value(locator));

    options.parse_positional({"locator"});
    options.positional_help("<locator>");

    auto printHelp = [&] {
        fmt::print("{}\n", options.help());
        fmt::print("  <locator> is a file: or http: locator, such as:\n");
        fmt::print("    file:///data/cells/0.raw\n");
        fmt::print("    file:relative/path.raw\n");
        fmt::print("    http://example.com/cells/0.raw\n");
    };

    try {
        auto result = options.parse(argc, argv);

        if (showHelp) {
            printHelp();
            return 0;
        }

        if (!result.contains("locator")) {
            fmt::print(stderr, "Missing argument: <locator>\n\n");
            printHelp();
            return 1;
        }

        // Build configuration from the optional file, then let flags override it
        core::Configuration config{};
        if (result.contains("config")) {
            auto loadResult = app::LoadConfigFile(configFile, config);
            if (!loadResult) {
                fmt::print(stderr, "{}\n", loadResult.string());
                return 1;
            }
        }
        if (result.contains("mmap")) {
            config.files.memoryMap = memoryMap;
        }
        if (result.contains("verbose")) {
            config.transport.verbose = verbose;
        }

        std::optional<cell::ElementType> elementType{};
        if (result.contains("type")) {
            elementType = cell::ParseElementType(typeName);
            if (!elementType) {
                fmt::print(stderr, "Invalid element type: {}\n\n", typeName);
                printHelp();
                return 1;
            }
        }

        const io::HandleRegistry registry = io::MakeDefaultRegistry(config);
        std::error_code error{};
        auto handle = registry.Open(locator, error);
        if (error) {
            fmt::print(stderr, "Could not open {}: {}\n", locator, error.message());
            return 1;
        }

        handle->Seek(static_cast<sint64>(offset), error);
        if (error) {
            fmt::print(stderr, "Could not seek to {}: {}\n", offset, error.message());
            return 1;
        }

        std::vector<uint8> data(length);
        data.resize(handle->Read(data, error));
        if (error) {
            fmt::print(stderr, "Read failed at {}: {}\n", handle->Position(), error.message());
            return 1;
        }

        if (rewind > 0) {
            rewind = std::min<uint64>(rewind, data.size());
            const uint64 connections = handle->ConnectionCount();
            handle->Seek(static_cast<sint64>(handle->Position() - rewind), error);
            if (error) {
                fmt::print(stderr, "Could not rewind by {} bytes: {}\n", rewind, error.message());
                return 1;
            }

            std::vector<uint8> again(rewind);
            handle->ReadFully(again, error);
            if (error) {
                fmt::print(stderr, "Read after rewind failed: {}\n", error.message());
                return 1;
            }
            const bool matches = std::equal(again.cbegin(), again.cend(), data.cend() - rewind);
            fmt::print(stderr, "Rewound {} bytes ({}, {})\n", rewind,
                       (handle->ConnectionCount() == connections ? "no reconnection" : "reconnected"),
                       (matches ? "data matches" : "DATA MISMATCH"));
            if (!matches) {
                return 1;
            }
        }

        if (!elementType) {
            app::PrintHexDump(data, offset);
            return 0;
        }

        // Decode the bytes as one plane of a cell with room for planes [0, plane]
        const cell::PlaneFormat format{
            .bitsPerPixel = bits != 0 ? bits : cell::ElementBits(*elementType),
            .littleEndian = !bigEndian,
        };
        const uint32 bytesPerElement = format.bitsPerPixel / 8;
        const uint64 planeElements = bytesPerElement != 0 ? data.size() / bytesPerElement : 0;

        const cell::FixedPlaneFormat metadata{format};
        const cell::ArrayLoader loader{*elementType, metadata};
        const std::array<uint32, 2> dims{static_cast<uint32>(plane + 1), static_cast<uint32>(planeElements)};
        cell::TypedArray cellArray = loader.EmptyArray(dims);

        const uint64 count = loader.Load(cellArray, data, plane, error);
        if (error) {
            fmt::print(stderr, "Could not decode plane {} as {}: {}\n", plane, cell::ElementTypeName(*elementType),
                       error.message());
            return 1;
        }
        app::PrintElements(cellArray, plane * count, count);
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::print(stderr, "Failed to parse arguments: {}\n", e.what());
        return -1;
    } catch (const std::system_error &e) {
        fmt::print(stderr, "System error: {}\n", e.what());
        return e.code().value();
    } catch (const std::exception &e) {
        fmt::print(stderr, "Unhandled exception: {}\n", e.what());
        return -1;
    }
}
