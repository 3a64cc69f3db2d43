#pragma once

#include "byte_source.hpp"

#include <mio/mmap.hpp>

#include <filesystem>
#include <span>

namespace tessera::io {

// Implementation of IByteSource backed by a memory-mapped file.
//
// Empty files cannot be mapped. They are opened without a mapping and behave as an empty resource.
class MemoryMappedByteSource final : public IByteSource {
public:
    // Initializes a byte source pointing to the specified file.
    // The file is not mapped until Open() is invoked.
    MemoryMappedByteSource(std::filesystem::path path)
        : m_path(std::move(path)) {}

    MemoryMappedByteSource(const MemoryMappedByteSource &) = delete;
    MemoryMappedByteSource(MemoryMappedByteSource &&) = default;

    MemoryMappedByteSource &operator=(const MemoryMappedByteSource &) = delete;
    MemoryMappedByteSource &operator=(MemoryMappedByteSource &&) = default;

    // Missing or unmappable files are reported as StreamError::TransportError.
    void Open(std::error_code &error) final;

    void Close() final {
        m_in.unmap();
        m_open = false;
    }

    std::optional<uint64> Size() const final {
        return m_in.size();
    }

    uint64 Read(std::span<uint8> output, std::error_code &error) final;
    uint32 Skip(uint32 count, std::error_code &error) final;

private:
    std::filesystem::path m_path;
    mio::mmap_source m_in;
    uint64 m_cursor = 0;
    bool m_open = false;
};

} // namespace tessera::io
