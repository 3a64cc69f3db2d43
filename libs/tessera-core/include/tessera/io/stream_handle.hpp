#pragma once

/**
@file
@brief Defines `tessera::io::StreamHandle`, a seekable reader over forward-only byte sources.
*/

#include <tessera/core/types.hpp>

#include <tessera/io/byte_source/byte_source.hpp>
#include <tessera/io/rewind_buffer.hpp>

#include <tessera/util/data_ops.hpp>
#include <tessera/util/size_ops.hpp>

#include <array>
#include <concepts>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>

namespace tessera::io {

/// @brief Capacity of the rewind buffer, shared by every handle.
inline constexpr size_t kMaxOverhead = 1_MiB;

/// @brief Largest number of bytes passed to a single `IByteSource::Skip` call.
inline constexpr uint32 kMaxSkipChunk = 0x7FFF'FFFF;

/// @brief Provides random access on top of a forward-only `IByteSource`.
///
/// The handle keeps the most recently streamed bytes in a rewind buffer of `kMaxOverhead` bytes. The oldest offset
/// still held in the buffer is the *mark*. Seeking backwards to any offset in [mark, position) replays bytes from the
/// buffer without touching the transport. Seeking further back reconnects the transport and skips forward from the
/// start of the resource; seeking forward skips on the transport. Either way, the rewind buffer is re-primed at the new
/// position.
///
/// Invariant: `Mark() <= Position()`.
///
/// Errors are reported through `std::error_code` values of the `StreamError` enum, or whatever the byte source
/// reports for failures during `Open()`. Reads that stop short at the end of the resource are not errors.
///
/// Thread-safety
/// -------------
/// A handle must not be used from multiple threads at once. Independent handles share no state.
class StreamHandle {
public:
    /// @brief Creates a closed handle around the given byte source.
    /// @param[in] locator the locator the source was built from, kept for diagnostics
    /// @param[in] source the byte source to read from
    StreamHandle(std::string locator, std::unique_ptr<IByteSource> source);
    ~StreamHandle();

    StreamHandle(const StreamHandle &) = delete;
    StreamHandle(StreamHandle &&) = default;

    StreamHandle &operator=(const StreamHandle &) = delete;
    StreamHandle &operator=(StreamHandle &&) = default;

    /// @brief Connects the byte source and primes the rewind buffer at offset 0.
    ///
    /// Fails with `StreamError::ClosedHandle` if the handle was closed.
    ///
    /// @param[out] error receives the failure, if any
    void Open(std::error_code &error);

    /// @brief Releases the transport. Every subsequent operation fails with `StreamError::ClosedHandle`.
    void Close();

    /// @brief Moves the read cursor to the given absolute offset.
    ///
    /// Targets in [mark, position) are served from the rewind buffer with no I/O. `target == position` does nothing.
    ///
    /// If the resource length is unknown and the resource ends before `target`, the cursor stops at the end of the
    /// resource and the length becomes known.
    ///
    /// @param[in] target the offset to move to
    /// @param[out] error receives `StreamError::SeekOutOfRange` if `target` is negative or past the known length, in
    /// which case the position and mark are unchanged
    void Seek(sint64 target, std::error_code &error);

    /// @brief Reads up to `output.size()` bytes.
    /// @param[out] output the buffer to read into
    /// @param[out] error receives the failure, if any
    /// @return the number of bytes read; less than `output.size()` only at the end of the resource or on failure
    uint64 Read(std::span<uint8> output, std::error_code &error);

    /// @brief Reads exactly `output.size()` bytes.
    ///
    /// Fails with `StreamError::UnexpectedEndOfStream` if the resource ends first. The bytes that were available are
    /// still consumed.
    void ReadFully(std::span<uint8> output, std::error_code &error);

    /// @brief Reads an unsigned integer in the given byte order.
    template <std::unsigned_integral T>
    T ReadUnsigned(bool littleEndian, std::error_code &error) {
        std::array<uint8, sizeof(T)> bytes{};
        ReadFully(bytes, error);
        if (error) {
            return 0;
        }
        return littleEndian ? util::ReadLE<T>(bytes.data()) : util::ReadBE<T>(bytes.data());
    }

    /// @brief Advances the read cursor by `count` bytes without returning them.
    ///
    /// Bytes still held in the rewind buffer are consumed first. The rest is skipped on the transport in chunks of at
    /// most `kMaxSkipChunk` bytes. A chunk that makes no progress is treated as the end of the resource.
    ///
    /// @return the number of bytes actually skipped
    uint64 Skip(uint64 count, std::error_code &error);

    [[nodiscard]] bool IsOpen() const {
        return m_open;
    }

    [[nodiscard]] uint64 Position() const {
        return m_position;
    }

    /// @brief The oldest offset that can be sought to without reconnecting.
    [[nodiscard]] uint64 Mark() const {
        return m_streamPosition - m_buffer.Size();
    }

    /// @brief The total length of the resource, if known.
    [[nodiscard]] std::optional<uint64> Length() const {
        return m_length;
    }

    /// @brief The number of bytes between the read cursor and the end of the resource, if the length is known.
    [[nodiscard]] std::optional<uint64> Remaining() const;

    /// @brief The number of times the transport has been connected, including the initial connection.
    [[nodiscard]] uint32 ConnectionCount() const {
        return m_connectionCount;
    }

    [[nodiscard]] const std::string &Locator() const {
        return m_locator;
    }

private:
    std::string m_locator;
    std::unique_ptr<IByteSource> m_source;
    RewindBuffer m_buffer{kMaxOverhead};

    bool m_open = false;
    uint64 m_position = 0;       // logical read cursor
    uint64 m_streamPosition = 0; // offset reached by the transport; the buffer ends here
    std::optional<uint64> m_length;
    uint32 m_connectionCount = 0;

    // (Re)connects the transport and resets all cursors to offset 0.
    // Closes the handle if the connection fails.
    void Connect(std::error_code &error);

    // Records the end of the resource if the length was not known yet.
    void ReachedEnd();
};

} // namespace tessera::io
