#pragma once

#include "byte_source.hpp"

#include <tessera/io/stream_error.hpp>

#include <algorithm>
#include <span>
#include <vector>

namespace tessera::io {

// Implementation of IByteSource that streams from an in-memory buffer.
class MemoryByteSource final : public IByteSource {
public:
    // Initializes an empty in-memory buffer.
    MemoryByteSource() = default;

    // Initializes an in-memory buffer with a copy of the provided data.
    MemoryByteSource(std::span<const uint8> data)
        : m_data(data.begin(), data.end()) {}

    // Initializes an in-memory buffer using the vector as the buffer.
    // The given vector is moved into this object.
    MemoryByteSource(std::vector<uint8> &&data) {
        m_data.swap(data);
    }

    MemoryByteSource(const MemoryByteSource &) = default;
    MemoryByteSource(MemoryByteSource &&) = default;

    MemoryByteSource &operator=(const MemoryByteSource &) = default;
    MemoryByteSource &operator=(MemoryByteSource &&) = default;

    void Open(std::error_code &error) final {
        error.clear();
        m_cursor = 0;
        m_open = true;
    }

    void Close() final {
        m_open = false;
    }

    std::optional<uint64> Size() const final {
        return m_data.size();
    }

    uint64 Read(std::span<uint8> output, std::error_code &error) final {
        error.clear();
        if (!m_open) {
            error = StreamError::ClosedHandle;
            return 0;
        }
        const uint64 size = std::min<uint64>(output.size(), m_data.size() - m_cursor);
        std::copy_n(m_data.cbegin() + m_cursor, size, output.begin());
        m_cursor += size;
        return size;
    }

    uint32 Skip(uint32 count, std::error_code &error) final {
        error.clear();
        if (!m_open) {
            error = StreamError::ClosedHandle;
            return 0;
        }
        const uint32 size = static_cast<uint32>(std::min<uint64>(count, m_data.size() - m_cursor));
        m_cursor += size;
        return size;
    }

private:
    std::vector<uint8> m_data;
    uint64 m_cursor = 0;
    bool m_open = false;
};

} // namespace tessera::io
