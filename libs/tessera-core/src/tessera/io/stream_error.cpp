#include <tessera/io/stream_error.hpp>

#include <string>

namespace tessera::io {

namespace {

    class StreamErrorCategoryImpl final : public std::error_category {
    public:
        const char *name() const noexcept final {
            return "tessera.stream";
        }

        std::string message(int condition) const final {
            switch (static_cast<StreamError>(condition)) {
            case StreamError::UnsupportedLocator: return "Locator does not match any supported scheme";
            case StreamError::SeekOutOfRange: return "Seek target is out of range";
            case StreamError::TransportError: return "Transport error";
            case StreamError::ClosedHandle: return "Handle is closed";
            case StreamError::UnexpectedEndOfStream: return "Unexpected end of stream";
            default: return "Unknown stream error";
            }
        }
    };

} // namespace

const std::error_category &StreamErrorCategory() noexcept {
    static const StreamErrorCategoryImpl category{};
    return category;
}

std::error_code make_error_code(StreamError error) noexcept {
    return {static_cast<int>(error), StreamErrorCategory()};
}

} // namespace tessera::io
