#pragma once

/**
@file
@brief Defines `tessera::cell::ArrayLoader`, which fills typed arrays from raw planes.
*/

#include "element_type.hpp"
#include "typed_array.hpp"

#include <span>
#include <system_error>

namespace tessera::cell {

/// @brief Describes how the elements of a plane are encoded.
struct PlaneFormat {
    uint32 bitsPerPixel = 8;
    bool littleEndian = true;
};

/// @brief Interface for plane metadata lookups.
class IMetadataProvider {
public:
    virtual ~IMetadataProvider() = default;

    /// @brief Retrieves the encoding of the given plane.
    virtual PlaneFormat GetPlaneFormat(uint64 planeIndex) const = 0;
};

/// @brief A metadata provider that reports the same format for every plane.
class FixedPlaneFormat final : public IMetadataProvider {
public:
    explicit FixedPlaneFormat(PlaneFormat format)
        : m_format(format) {}

    PlaneFormat GetPlaneFormat(uint64) const final {
        return m_format;
    }

private:
    PlaneFormat m_format;
};

/// @brief Loads raw planes into arrays of a fixed element type.
///
/// The plane format is queried from the metadata provider on every `Load` call and never cached, so a provider may
/// report different formats over time. The provider must outlive the loader.
class ArrayLoader {
public:
    ArrayLoader(ElementType type, const IMetadataProvider &metadata);

    [[nodiscard]] ElementType Type() const {
        return m_type;
    }

    /// @brief The width of the produced elements in bits.
    [[nodiscard]] uint32 BitsPerElement() const {
        return ElementBits(m_type);
    }

    /// @brief Allocates a zero-filled array of the loader's element type sized for the given dimensions.
    [[nodiscard]] TypedArray EmptyArray(std::span<const uint32> dimensions) const;

    /// @brief Decodes a plane into the destination array.
    ///
    /// Fails with `LoaderError::ElementTypeMismatch` if the destination holds a different element type, or with any
    /// error reported by `ConvertPlane`. The destination is left untouched on failure.
    ///
    /// @param[out] destination the array to write into
    /// @param[in] rawBytes the encoded plane
    /// @param[in] planeIndex the index of the plane within the array
    /// @param[out] error receives the failure, if any
    /// @return the number of elements written
    uint64 Load(TypedArray &destination, std::span<const uint8> rawBytes, uint64 planeIndex,
                std::error_code &error) const;

private:
    ElementType m_type;
    const IMetadataProvider &m_metadata;
};

} // namespace tessera::cell
