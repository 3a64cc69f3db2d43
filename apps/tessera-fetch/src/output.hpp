#pragma once

#include <tessera/core/types.hpp>

#include <tessera/cell/typed_array.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <span>
#include <variant>

namespace app {

inline constexpr size_t kHexDumpBytesPerLine = 16;

// Prints a classic hex dump of `data`. Addresses start at `baseOffset`.
inline void PrintHexDump(std::span<const uint8> data, uint64 baseOffset) {
    for (size_t lineStart = 0; lineStart < data.size(); lineStart += kHexDumpBytesPerLine) {
        const auto line = data.subspan(lineStart, std::min(kHexDumpBytesPerLine, data.size() - lineStart));

        fmt::print("{:012X} ", baseOffset + lineStart);
        for (size_t i = 0; i < kHexDumpBytesPerLine; i++) {
            if (i == kHexDumpBytesPerLine / 2) {
                fmt::print(" ");
            }
            if (i < line.size()) {
                fmt::print(" {:02X}", line[i]);
            } else {
                fmt::print("   ");
            }
        }
        fmt::print("  |");
        for (const uint8 b : line) {
            fmt::print("{}", (b >= 0x20 && b < 0x7F) ? static_cast<char>(b) : '.');
        }
        fmt::print("|\n");
    }
}

// Prints `count` elements of `array` starting at `first`, one per line, prefixed by their index.
inline void PrintElements(const tessera::cell::TypedArray &array, uint64 first, uint64 count) {
    std::visit(
        [&](const auto &elements) {
            for (uint64 i = first; i < first + count && i < elements.size(); i++) {
                if constexpr (sizeof(elements[i]) == 1) {
                    // Avoid printing int8 values as characters
                    fmt::print("[{}] {}\n", i, static_cast<sint32>(elements[i]));
                } else {
                    fmt::print("[{}] {}\n", i, elements[i]);
                }
            }
        },
        array);
}

} // namespace app
