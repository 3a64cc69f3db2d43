#include <tessera/io/byte_source/byte_source_mmap.hpp>

#include <tessera/io/stream_error.hpp>

#include "io_devlog.hpp"

#include <algorithm>

namespace tessera::io {

void MemoryMappedByteSource::Open(std::error_code &error) {
    error.clear();
    m_cursor = 0;
    if (m_open) {
        // Reopening a mapping only rewinds it
        return;
    }

    std::error_code osError{};
    const uint64 size = std::filesystem::file_size(m_path, osError);
    if (osError) {
        devlog::error<grp::transport>("{}: {}", m_path.string(), osError.message());
        error = StreamError::TransportError;
        return;
    }
    if (size == 0) {
        devlog::debug<grp::transport>("{}: empty file, skipping mapping", m_path.string());
        m_open = true;
        return;
    }

    m_in = mio::make_mmap_source(m_path.native(), osError);
    if (osError) {
        devlog::error<grp::transport>("{}: could not map file: {}", m_path.string(), osError.message());
        m_in.unmap();
        error = StreamError::TransportError;
        return;
    }
    m_open = true;
}

uint64 MemoryMappedByteSource::Read(std::span<uint8> output, std::error_code &error) {
    error.clear();
    if (!m_open) {
        error = StreamError::ClosedHandle;
        return 0;
    }
    const uint64 size = std::min<uint64>(output.size(), m_in.size() - std::min<uint64>(m_cursor, m_in.size()));
    if (size > 0) {
        std::copy_n(m_in.begin() + m_cursor, size, output.begin());
    }
    m_cursor += size;
    return size;
}

uint32 MemoryMappedByteSource::Skip(uint32 count, std::error_code &error) {
    error.clear();
    if (!m_open) {
        error = StreamError::ClosedHandle;
        return 0;
    }
    const uint32 size = static_cast<uint32>(std::min<uint64>(count, m_in.size() - std::min<uint64>(m_cursor, m_in.size())));
    m_cursor += size;
    return size;
}

} // namespace tessera::io
