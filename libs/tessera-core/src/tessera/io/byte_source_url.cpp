#include <tessera/io/byte_source/byte_source_url.hpp>

#include <tessera/io/stream_error.hpp>

#include <tessera/util/scope_guard.hpp>

#include "io_devlog.hpp"

#include <algorithm>
#include <mutex>

namespace tessera::io {

// Poll timeout while waiting for socket activity. The transfer itself has no deadline.
static constexpr int kPollTimeoutMs = 1000;

static bool InitCurl() {
    static std::once_flag initFlag;
    static CURLcode initResult = CURLE_OK;
    std::call_once(initFlag, [] { initResult = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return initResult == CURLE_OK;
}

UrlByteSource::UrlByteSource(std::string url, const core::Configuration::Transport &config)
    : m_url(std::move(url))
    , m_config(config) {}

UrlByteSource::~UrlByteSource() {
    Close();
}

void UrlByteSource::Open(std::error_code &error) {
    error.clear();
    Close();

    if (!InitCurl()) {
        devlog::error<grp::transport>("Could not initialize libcurl");
        error = StreamError::TransportError;
        return;
    }

    CURL *easy = curl_easy_init();
    if (easy == nullptr) {
        error = StreamError::TransportError;
        return;
    }
    util::ScopeGuard sgCleanupEasy{[&] { curl_easy_cleanup(easy); }};

    m_errorMessage.fill('\0');

    const CURLcode result = [&] {
        CURLcode rc;
        if ((rc = curl_easy_setopt(easy, CURLOPT_URL, m_url.c_str())) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &UrlByteSource::WriteCallback)) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_WRITEDATA, static_cast<void *>(this))) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, m_errorMessage.data())) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L)) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L)) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, m_config.followRedirects ? 1L : 0L)) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_MAXREDIRS, static_cast<long>(m_config.maxRedirects))) != CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_config.connectTimeoutMs))) !=
            CURLE_OK) {
            return rc;
        }
        if ((rc = curl_easy_setopt(easy, CURLOPT_USERAGENT, m_config.userAgent.c_str())) != CURLE_OK) {
            return rc;
        }
        return curl_easy_setopt(easy, CURLOPT_VERBOSE, m_config.verbose ? 1L : 0L);
    }();
    if (result != CURLE_OK) {
        devlog::error<grp::transport>("{}: could not configure transfer: {}", m_url, curl_easy_strerror(result));
        error = StreamError::TransportError;
        return;
    }

    CURLM *multi = curl_multi_init();
    if (multi == nullptr) {
        error = StreamError::TransportError;
        return;
    }
    util::ScopeGuard sgCleanupMulti{[&] { curl_multi_cleanup(multi); }};

    if (const CURLMcode mresult = curl_multi_add_handle(multi, easy); mresult != CURLM_OK) {
        devlog::error<grp::transport>("{}: could not start transfer: {}", m_url, curl_multi_strerror(mresult));
        error = StreamError::TransportError;
        return;
    }

    // The handles are now owned by this object and released by Close()
    sgCleanupEasy.Cancel();
    sgCleanupMulti.Cancel();
    m_easy = easy;
    m_multi = multi;
    m_pending.clear();
    m_pendingPos = 0;
    m_paused = false;
    m_done = false;
    m_result = CURLE_OK;
    m_size.reset();

    // Run the transfer until the first bytes arrive so that the response headers, and with them the content length,
    // are known by the time Open() returns
    while (PendingBytes() == 0 && !m_done) {
        if (!Pump(error)) {
            Close();
            return;
        }
    }
    if (m_done && m_result != CURLE_OK) {
        ReportFailure(error);
        Close();
        return;
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(m_easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
        m_size = static_cast<uint64>(length);
    }

    if (m_size) {
        devlog::debug<grp::transport>("{}: connected, {} bytes", m_url, *m_size);
    } else {
        devlog::debug<grp::transport>("{}: connected, unknown length", m_url);
    }
}

void UrlByteSource::Close() {
    if (m_multi != nullptr) {
        if (m_easy != nullptr) {
            curl_multi_remove_handle(m_multi, m_easy);
        }
        curl_multi_cleanup(m_multi);
        m_multi = nullptr;
    }
    if (m_easy != nullptr) {
        curl_easy_cleanup(m_easy);
        m_easy = nullptr;
    }
    m_pending.clear();
    m_pendingPos = 0;
    m_paused = false;
    m_done = false;
}

uint64 UrlByteSource::Read(std::span<uint8> output, std::error_code &error) {
    error.clear();
    if (m_easy == nullptr) {
        error = StreamError::ClosedHandle;
        return 0;
    }
    if (output.empty()) {
        return 0;
    }

    while (PendingBytes() == 0 && !m_done) {
        if (!Pump(error)) {
            return 0;
        }
    }

    if (PendingBytes() == 0) {
        // Transfer finished and every delivered byte has been consumed
        if (m_result != CURLE_OK) {
            ReportFailure(error);
        }
        return 0;
    }

    const size_t size = std::min(output.size(), PendingBytes());
    std::copy_n(m_pending.cbegin() + m_pendingPos, size, output.begin());
    m_pendingPos += size;
    if (m_pendingPos == m_pending.size()) {
        m_pending.clear();
        m_pendingPos = 0;
    }
    return size;
}

bool UrlByteSource::Pump(std::error_code &error) {
    if (m_paused) {
        m_paused = false;
        // May invoke the write callback immediately with the data held back by the pause
        if (const CURLcode result = curl_easy_pause(m_easy, CURLPAUSE_CONT); result != CURLE_OK) {
            devlog::error<grp::transport>("{}: could not resume transfer: {}", m_url, curl_easy_strerror(result));
            error = StreamError::TransportError;
            return false;
        }
    }

    int running = 0;
    if (const CURLMcode result = curl_multi_perform(m_multi, &running); result != CURLM_OK) {
        devlog::error<grp::transport>("{}: transfer failed: {}", m_url, curl_multi_strerror(result));
        error = StreamError::TransportError;
        return false;
    }

    if (running == 0) {
        int queued = 0;
        while (CURLMsg *msg = curl_multi_info_read(m_multi, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                m_result = msg->data.result;
            }
        }
        m_done = true;
        devlog::trace<grp::transport>("{}: transfer finished: {}", m_url, curl_easy_strerror(m_result));
        return true;
    }

    if (PendingBytes() > 0 || m_paused) {
        return true;
    }

    if (const CURLMcode result = curl_multi_poll(m_multi, nullptr, 0, kPollTimeoutMs, nullptr); result != CURLM_OK) {
        devlog::error<grp::transport>("{}: poll failed: {}", m_url, curl_multi_strerror(result));
        error = StreamError::TransportError;
        return false;
    }
    return true;
}

void UrlByteSource::ReportFailure(std::error_code &error) const {
    devlog::error<grp::transport>("{}: {}", m_url,
                                  m_errorMessage[0] != '\0' ? m_errorMessage.data() : curl_easy_strerror(m_result));
    error = StreamError::TransportError;
}

size_t UrlByteSource::WriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto &source = *static_cast<UrlByteSource *>(userdata);
    const size_t total = size * nmemb;

    if (source.PendingBytes() >= kMaxPendingBytes) {
        // Hold the data back until the reader catches up; libcurl delivers it again once unpaused
        source.m_paused = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    if (source.m_pendingPos > 0) {
        source.m_pending.erase(source.m_pending.begin(), source.m_pending.begin() + source.m_pendingPos);
        source.m_pendingPos = 0;
    }
    source.m_pending.insert(source.m_pending.end(), reinterpret_cast<const uint8 *>(ptr),
                            reinterpret_cast<const uint8 *>(ptr) + total);
    return total;
}

} // namespace tessera::io
