#pragma once

#include <tessera/core/types.hpp>

#include <span>
#include <vector>

namespace tessera::io {

// Fixed-capacity ring buffer holding the most recently streamed bytes.
//
// Appending past the capacity drops the oldest bytes. Offsets passed to CopyOut() are relative to the oldest byte
// still held in the buffer.
class RewindBuffer {
public:
    explicit RewindBuffer(size_t capacity)
        : m_data(capacity) {}

    size_t Capacity() const {
        return m_data.size();
    }

    size_t Size() const {
        return m_size;
    }

    void Clear() {
        m_head = 0;
        m_size = 0;
    }

    // Appends the bytes to the buffer.
    // Returns the number of old bytes dropped to make room for them.
    size_t Append(std::span<const uint8> bytes);

    // Copies output.size() bytes starting at the given offset from the oldest byte into the output buffer.
    // The range must lie within [0, Size()).
    void CopyOut(size_t offset, std::span<uint8> output) const;

private:
    std::vector<uint8> m_data;
    size_t m_head = 0; // index of the oldest byte
    size_t m_size = 0;
};

} // namespace tessera::io
