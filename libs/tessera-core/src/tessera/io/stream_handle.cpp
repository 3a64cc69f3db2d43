#include <tessera/io/stream_handle.hpp>

#include <tessera/io/stream_error.hpp>

#include "io_devlog.hpp"

#include <algorithm>

namespace tessera::io {

StreamHandle::StreamHandle(std::string locator, std::unique_ptr<IByteSource> source)
    : m_locator(std::move(locator))
    , m_source(std::move(source)) {}

StreamHandle::~StreamHandle() {
    Close();
}

void StreamHandle::Open(std::error_code &error) {
    error.clear();
    if (!m_source) {
        error = StreamError::ClosedHandle;
        return;
    }

    Connect(error);
    if (error) {
        return;
    }

    if (m_length) {
        devlog::info<grp::handle>("Opened {} ({} bytes)", m_locator, *m_length);
    } else {
        devlog::info<grp::handle>("Opened {} (unknown length)", m_locator);
    }
}

void StreamHandle::Close() {
    if (!m_source) {
        return;
    }
    m_source->Close();
    m_source.reset();
    m_buffer.Clear();
    m_open = false;
    devlog::info<grp::handle>("Closed {}", m_locator);
}

void StreamHandle::Seek(sint64 target, std::error_code &error) {
    error.clear();
    if (!m_open) {
        error = StreamError::ClosedHandle;
        return;
    }
    if (target < 0 || (m_length && static_cast<uint64>(target) > *m_length)) {
        devlog::debug<grp::seek>("{}: seek to {} rejected", m_locator, target);
        error = StreamError::SeekOutOfRange;
        return;
    }

    const uint64 offset = static_cast<uint64>(target);
    if (offset == m_position) {
        return;
    }

    const uint64 mark = Mark();
    if (offset >= mark && offset < m_position) {
        // Rewind to the mark and skip forward through the buffered bytes
        devlog::trace<grp::seek>("{}: {} -> {} from rewind buffer", m_locator, m_position, offset);
        m_position = mark;
        Skip(offset - mark, error);
        return;
    }

    if (offset < mark) {
        devlog::debug<grp::seek>("{}: {} -> {} is before mark {}, reconnecting", m_locator, m_position, offset, mark);
        Connect(error);
        if (error) {
            return;
        }
    } else {
        devlog::trace<grp::seek>("{}: {} -> {} skipping forward", m_locator, m_position, offset);
    }
    Skip(offset - m_position, error);
}

uint64 StreamHandle::Read(std::span<uint8> output, std::error_code &error) {
    error.clear();
    if (!m_open) {
        error = StreamError::ClosedHandle;
        return 0;
    }

    uint64 total = 0;

    // Replay bytes from the rewind buffer
    if (m_position < m_streamPosition) {
        const uint64 count = std::min<uint64>(output.size(), m_streamPosition - m_position);
        m_buffer.CopyOut(m_position - Mark(), output.first(count));
        m_position += count;
        total += count;
    }

    // Pull the rest from the transport, keeping a copy for rewinds
    while (total < output.size()) {
        const std::span<uint8> chunk = output.subspan(total);
        const uint64 count = m_source->Read(chunk, error);

        // Bytes delivered alongside an error were consumed from the transport and must be kept
        m_buffer.Append(chunk.first(count));
        m_position += count;
        m_streamPosition += count;
        total += count;

        if (error) {
            devlog::error<grp::handle>("{}: read failed at {}: {}", m_locator, m_position, error.message());
            break;
        }
        if (count == 0) {
            ReachedEnd();
            break;
        }
    }

    return total;
}

void StreamHandle::ReadFully(std::span<uint8> output, std::error_code &error) {
    const uint64 count = Read(output, error);
    if (!error && count < output.size()) {
        error = StreamError::UnexpectedEndOfStream;
    }
}

uint64 StreamHandle::Skip(uint64 count, std::error_code &error) {
    error.clear();
    if (!m_open) {
        error = StreamError::ClosedHandle;
        return 0;
    }

    // Consume bytes still held in the rewind buffer
    uint64 skipped = std::min(count, m_streamPosition - m_position);
    m_position += skipped;

    // Skip the rest on the transport. Those bytes are never seen, so the rewind buffer restarts after them.
    while (skipped < count) {
        const uint32 chunk = static_cast<uint32>(std::min<uint64>(count - skipped, kMaxSkipChunk));
        const uint32 chunkSkipped = m_source->Skip(chunk, error);
        if (chunkSkipped > 0) {
            m_buffer.Clear();
            skipped += chunkSkipped;
            m_position += chunkSkipped;
            m_streamPosition += chunkSkipped;
        }
        if (error) {
            devlog::error<grp::handle>("{}: skip failed at {}: {}", m_locator, m_position, error.message());
            break;
        }
        if (chunkSkipped == 0) {
            ReachedEnd();
            break;
        }
    }

    return skipped;
}

std::optional<uint64> StreamHandle::Remaining() const {
    if (!m_length) {
        return std::nullopt;
    }
    return *m_length - std::min(m_position, *m_length);
}

void StreamHandle::Connect(std::error_code &error) {
    m_source->Open(error);
    if (error) {
        devlog::error<grp::handle>("{}: could not connect: {}", m_locator, error.message());
        Close();
        return;
    }
    ++m_connectionCount;

    m_open = true;
    m_position = 0;
    m_streamPosition = 0;
    m_buffer.Clear();
    if (const auto size = m_source->Size()) {
        m_length = size;
    }
}

void StreamHandle::ReachedEnd() {
    if (!m_length) {
        m_length = m_streamPosition;
        devlog::debug<grp::handle>("{}: reached end of resource at {}", m_locator, m_streamPosition);
    }
}

} // namespace tessera::io
