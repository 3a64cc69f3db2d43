#pragma once

#include "byte_source.hpp"

#include <tessera/core/configuration.hpp>

#include <curl/curl.h>

#include <array>
#include <string>
#include <vector>

namespace tessera::io {

// Implementation of IByteSource that streams a URL through libcurl.
//
// The transfer is driven through the multi interface as a pull stream: Read() pumps the transfer until the write
// callback has delivered some bytes. The transfer is paused while too many delivered bytes are waiting to be consumed
// and resumed on the next Read(), so memory usage stays bounded regardless of the resource size.
//
// Any protocol supported by the linked libcurl works, though the default handle registry only routes http: locators
// here. HTTP error statuses (400 and above) are reported as transport errors. Nothing is retried.
class UrlByteSource final : public IByteSource {
public:
    // Maximum number of delivered but unconsumed bytes before the transfer is paused.
    static constexpr size_t kMaxPendingBytes = 256 * 1024;

    // Initializes a byte source pointing to the specified URL.
    // No connection is made until Open() is invoked.
    UrlByteSource(std::string url, const core::Configuration::Transport &config);
    ~UrlByteSource() override;

    // The libcurl handles keep a pointer to this object
    UrlByteSource(const UrlByteSource &) = delete;
    UrlByteSource(UrlByteSource &&) = delete;

    UrlByteSource &operator=(const UrlByteSource &) = delete;
    UrlByteSource &operator=(UrlByteSource &&) = delete;

    void Open(std::error_code &error) final;
    void Close() final;

    std::optional<uint64> Size() const final {
        return m_size;
    }

    uint64 Read(std::span<uint8> output, std::error_code &error) final;

    const std::string &URL() const {
        return m_url;
    }

private:
    std::string m_url;
    core::Configuration::Transport m_config;

    CURL *m_easy = nullptr;
    CURLM *m_multi = nullptr;

    std::vector<uint8> m_pending; // bytes delivered by libcurl
    size_t m_pendingPos = 0;      // read cursor into m_pending
    bool m_paused = false;        // the transfer is paused until the pending bytes are consumed
    bool m_done = false;          // the transfer has finished, successfully or not
    CURLcode m_result = CURLE_OK; // result of the finished transfer

    std::optional<uint64> m_size;

    std::array<char, CURL_ERROR_SIZE> m_errorMessage{};

    size_t PendingBytes() const {
        return m_pending.size() - m_pendingPos;
    }

    // Drives the transfer one step, waiting for socket activity if nothing is ready.
    // Returns false and fills in the error code if the multi interface fails.
    bool Pump(std::error_code &error);

    // Reports the result of a failed transfer.
    void ReportFailure(std::error_code &error) const;

    static size_t WriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
};

} // namespace tessera::io
