#pragma once

#include "byte_source.hpp"

#include <filesystem>
#include <fstream>
#include <span>

namespace tessera::io {

// Implementation of IByteSource backed by a file stream.
class FileByteSource final : public IByteSource {
public:
    // Initializes a byte source pointing to the specified file.
    // The file is not opened until Open() is invoked.
    FileByteSource(std::filesystem::path path)
        : m_path(std::move(path)) {}

    FileByteSource(const FileByteSource &) = delete;
    FileByteSource(FileByteSource &&) = default;

    FileByteSource &operator=(const FileByteSource &) = delete;
    FileByteSource &operator=(FileByteSource &&) = default;

    // Missing or unreadable files are reported as StreamError::TransportError.
    void Open(std::error_code &error) final;

    void Close() final {
        if (m_in.is_open()) {
            m_in.close();
        }
    }

    std::optional<uint64> Size() const final {
        return m_size;
    }

    uint64 Read(std::span<uint8> output, std::error_code &error) final;
    uint32 Skip(uint32 count, std::error_code &error) final;

private:
    std::filesystem::path m_path;
    std::ifstream m_in;
    uint64 m_size = 0;
    uint64 m_cursor = 0;
};

} // namespace tessera::io
