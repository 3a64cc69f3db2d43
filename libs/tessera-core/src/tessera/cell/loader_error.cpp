#include <tessera/cell/loader_error.hpp>

#include <string>

namespace tessera::cell {

namespace {

    class LoaderErrorCategoryImpl final : public std::error_category {
    public:
        const char *name() const noexcept final {
            return "tessera.loader";
        }

        std::string message(int condition) const final {
            switch (static_cast<LoaderError>(condition)) {
            case LoaderError::UnsupportedBitDepth: return "Unsupported bit depth";
            case LoaderError::TruncatedPlane: return "Plane data is not a whole number of elements";
            case LoaderError::DestinationTooSmall: return "Destination array is too small for the plane";
            case LoaderError::ElementTypeMismatch: return "Destination array has the wrong element type";
            default: return "Unknown loader error";
            }
        }
    };

} // namespace

const std::error_category &LoaderErrorCategory() noexcept {
    static const LoaderErrorCategoryImpl category{};
    return category;
}

std::error_code make_error_code(LoaderError error) noexcept {
    return {static_cast<int>(error), LoaderErrorCategory()};
}

} // namespace tessera::cell
