#include <tessera/io/rewind_buffer.hpp>

#include <algorithm>
#include <cassert>

namespace tessera::io {

size_t RewindBuffer::Append(std::span<const uint8> bytes) {
    const size_t capacity = m_data.size();
    if (capacity == 0) {
        return bytes.size();
    }

    size_t dropped = 0;
    if (bytes.size() >= capacity) {
        // Only the tail of the input fits; everything currently held is dropped too
        dropped = m_size + bytes.size() - capacity;
        bytes = bytes.last(capacity);
        std::copy(bytes.begin(), bytes.end(), m_data.begin());
        m_head = 0;
        m_size = capacity;
        return dropped;
    }

    if (m_size + bytes.size() > capacity) {
        dropped = m_size + bytes.size() - capacity;
        m_head = (m_head + dropped) % capacity;
        m_size -= dropped;
    }

    // Write in up to two pieces, wrapping around the end of the storage
    const size_t tail = (m_head + m_size) % capacity;
    const size_t first = std::min(bytes.size(), capacity - tail);
    std::copy_n(bytes.begin(), first, m_data.begin() + tail);
    std::copy(bytes.begin() + first, bytes.end(), m_data.begin());
    m_size += bytes.size();
    return dropped;
}

void RewindBuffer::CopyOut(size_t offset, std::span<uint8> output) const {
    assert(offset + output.size() <= m_size);
    if (output.empty()) {
        return;
    }

    const size_t capacity = m_data.size();
    const size_t start = (m_head + offset) % capacity;
    const size_t first = std::min(output.size(), capacity - start);
    std::copy_n(m_data.begin() + start, first, output.begin());
    std::copy_n(m_data.begin(), output.size() - first, output.begin() + first);
}

} // namespace tessera::io
