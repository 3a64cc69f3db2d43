#include <tessera/io/byte_source/byte_source.hpp>

#include <tessera/util/size_ops.hpp>

#include <algorithm>
#include <array>

namespace tessera::io {

uint32 IByteSource::Skip(uint32 count, std::error_code &error) {
    error.clear();

    std::array<uint8, 64_KiB> scratch{};
    uint32 skipped = 0;
    while (skipped < count) {
        const uint32 chunk = std::min<uint32>(count - skipped, scratch.size());
        const uint64 readCount = Read(std::span{scratch}.first(chunk), error);
        skipped += static_cast<uint32>(readCount);
        if (error || readCount == 0) {
            break;
        }
    }
    return skipped;
}

} // namespace tessera::io
