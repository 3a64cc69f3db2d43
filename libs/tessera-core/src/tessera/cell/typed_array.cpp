#include <tessera/cell/typed_array.hpp>

#include <tessera/util/constexpr_for.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace tessera::cell {

static constexpr std::array<std::string_view, kElementTypeCount> kElementTypeNames = {
    "i8", "i16", "i32", "i64", "f32", "f64",
};

std::string_view ElementTypeName(ElementType type) {
    return kElementTypeNames[static_cast<size_t>(type)];
}

std::optional<ElementType> ParseElementType(std::string_view name) {
    std::string lcName{name};
    std::transform(lcName.cbegin(), lcName.cend(), lcName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (size_t i = 0; i < kElementTypeNames.size(); i++) {
        if (lcName == kElementTypeNames[i]) {
            return static_cast<ElementType>(i);
        }
    }
    return std::nullopt;
}

uint64 CountEntities(std::span<const uint32> dimensions) {
    uint64 count = 1;
    for (const uint32 dimension : dimensions) {
        count *= dimension;
    }
    return count;
}

TypedArray EmptyArray(ElementType type, std::span<const uint32> dimensions) {
    const uint64 count = CountEntities(dimensions);
    TypedArray array{};
    util::constexpr_for<kElementTypeCount>([&](auto index) {
        if (static_cast<size_t>(type) == index) {
            array.emplace<decltype(index)::value>(count);
        }
    });
    return array;
}

} // namespace tessera::cell
