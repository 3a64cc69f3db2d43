#pragma once

#include <tessera/core/types.hpp>

#include <optional>
#include <span>
#include <system_error>

namespace tessera::io {

// Interface that specifies the contract for forward-only byte transports.
//
// A byte source only knows how to (re)connect to the start of its resource, stream bytes forward and report the
// resource size when the transport knows it. Seeking, rewinding and mark management are layered on top of it by
// StreamHandle.
class IByteSource {
public:
    virtual ~IByteSource() = default;

    // Establishes the transport and positions it at the start of the resource.
    // If the source is already open, the previous connection is released first.
    // Failures are reported through the error code; the source is left closed.
    virtual void Open(std::error_code &error) = 0;

    // Releases the transport. Does nothing if the source is not open.
    virtual void Close() = 0;

    // Returns the total size of the resource, if the transport reported one.
    virtual std::optional<uint64> Size() const = 0;

    // Reads up to output.size() bytes into the output buffer.
    // Returns the number of bytes actually read, which may be less than requested even before the end of the resource.
    // Returns 0 at the end of the resource. Failures are reported through the error code.
    // A failed read may still return the number of bytes transferred before the failure; those bytes are valid and the
    // transport has moved past them.
    virtual uint64 Read(std::span<uint8> output, std::error_code &error) = 0;

    // Skips up to count bytes. Returns the number of bytes actually skipped, which may be less than requested.
    // Returns 0 when no bytes are available. As with Read(), a failed skip may return the bytes skipped before the failure.
    //
    // The default implementation reads the bytes into a scratch buffer and discards them.
    virtual uint32 Skip(uint32 count, std::error_code &error);
};

} // namespace tessera::io
