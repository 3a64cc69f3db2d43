#include <tessera/io/byte_source/byte_source_file.hpp>

#include <tessera/io/stream_error.hpp>

#include "io_devlog.hpp"

#include <algorithm>
#include <cerrno>

namespace tessera::io {

void FileByteSource::Open(std::error_code &error) {
    error.clear();
    Close();

    // Get the file size; this also reports missing files
    std::error_code osError{};
    m_size = std::filesystem::file_size(m_path, osError);
    if (osError) {
        devlog::error<grp::transport>("{}: {}", m_path.string(), osError.message());
        m_size = 0;
        error = StreamError::TransportError;
        return;
    }

    // Try opening the file for read
    m_in = std::ifstream{m_path, std::ios::binary};
    if (!m_in) {
        osError = errno != 0 ? std::error_code{errno, std::generic_category()}
                             : std::make_error_code(std::errc::io_error);
        devlog::error<grp::transport>("{}: {}", m_path.string(), osError.message());
        error = StreamError::TransportError;
        return;
    }
    m_cursor = 0;
}

uint64 FileByteSource::Read(std::span<uint8> output, std::error_code &error) {
    error.clear();
    if (!m_in.is_open()) {
        error = StreamError::ClosedHandle;
        return 0;
    }
    if (m_cursor >= m_size) {
        return 0;
    }
    // Limit size to the smallest of the output buffer size and the amount of bytes left in the file
    const uint64 size = std::min<uint64>(output.size(), m_size - m_cursor);
    m_in.read(reinterpret_cast<char *>(output.data()), size);
    const uint64 readCount = m_in.gcount();
    if (readCount < size && m_in.bad()) {
        devlog::error<grp::transport>("{}: read failed after {} of {} bytes", m_path.string(), readCount, size);
        error = StreamError::TransportError;
    }
    m_in.clear();
    m_cursor += readCount;
    return readCount;
}

uint32 FileByteSource::Skip(uint32 count, std::error_code &error) {
    error.clear();
    if (!m_in.is_open()) {
        error = StreamError::ClosedHandle;
        return 0;
    }
    const uint32 size = static_cast<uint32>(std::min<uint64>(count, m_size - std::min(m_cursor, m_size)));
    m_in.seekg(size, std::ios::cur);
    if (!m_in) {
        m_in.clear();
        devlog::error<grp::transport>("{}: seek to {} failed", m_path.string(), m_cursor + size);
        error = StreamError::TransportError;
        return 0;
    }
    m_cursor += size;
    return size;
}

} // namespace tessera::io
