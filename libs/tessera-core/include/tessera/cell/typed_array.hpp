#pragma once

/**
@file
@brief Defines `tessera::cell::TypedArray`, the destination of plane conversions.
*/

#include "element_type.hpp"

#include <span>
#include <variant>
#include <vector>

namespace tessera::cell {

/// @brief A flat array holding elements of one of the supported element types.
///
/// The active alternative index equals the `ElementType` enumerator value.
using TypedArray = std::variant<std::vector<sint8>, std::vector<sint16>, std::vector<sint32>, std::vector<sint64>,
                                std::vector<float32>, std::vector<float64>>;

static_assert(std::variant_size_v<TypedArray> == kElementTypeCount);

/// @brief Returns the element type held by the array.
inline ElementType GetElementType(const TypedArray &array) {
    return static_cast<ElementType>(array.index());
}

/// @brief Returns the number of elements in the array.
inline size_t ElementCount(const TypedArray &array) {
    return std::visit([](const auto &elements) { return elements.size(); }, array);
}

/// @brief Computes the number of elements in an array with the given dimensions.
///
/// An empty list of dimensions describes a single element.
uint64 CountEntities(std::span<const uint32> dimensions);

/// @brief Allocates a zero-filled array of the given element type with enough elements for the dimensions.
TypedArray EmptyArray(ElementType type, std::span<const uint32> dimensions);

} // namespace tessera::cell
