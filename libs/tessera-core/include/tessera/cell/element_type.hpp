#pragma once

/**
@file
@brief Element types of cell arrays.
*/

#include <tessera/core/types.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>

namespace tessera::cell {

/// @brief Element types that cell arrays can hold.
///
/// The enumerator order matches the alternative order of `TypedArray`.
enum class ElementType : uint8 { Int8, Int16, Int32, Int64, Float32, Float64 };

/// @brief Number of element types.
inline constexpr size_t kElementTypeCount = 6;

/// @brief Describes the numeric types an array element can be stored as.
template <typename T>
concept Element = std::same_as<T, sint8> || std::same_as<T, sint16> || std::same_as<T, sint32> ||
                  std::same_as<T, sint64> || std::same_as<T, float32> || std::same_as<T, float64>;

/// @brief Returns the width of the element type in bits.
constexpr uint32 ElementBits(ElementType type) {
    switch (type) {
    case ElementType::Int8: return 8;
    case ElementType::Int16: return 16;
    case ElementType::Int32: return 32;
    case ElementType::Int64: return 64;
    case ElementType::Float32: return 32;
    case ElementType::Float64: return 64;
    }
    return 0;
}

/// @brief Determines if the element type is a floating-point type.
constexpr bool IsFloatingPoint(ElementType type) {
    return type == ElementType::Float32 || type == ElementType::Float64;
}

/// @brief Returns the short name of the element type: i8, i16, i32, i64, f32 or f64.
std::string_view ElementTypeName(ElementType type);

/// @brief Parses a short element type name as returned by `ElementTypeName`. Case-insensitive.
std::optional<ElementType> ParseElementType(std::string_view name);

} // namespace tessera::cell
