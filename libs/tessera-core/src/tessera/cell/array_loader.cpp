#include <tessera/cell/array_loader.hpp>

#include <tessera/cell/convert.hpp>
#include <tessera/cell/loader_error.hpp>

#include "cell_devlog.hpp"

namespace tessera::cell {

ArrayLoader::ArrayLoader(ElementType type, const IMetadataProvider &metadata)
    : m_type(type)
    , m_metadata(metadata) {}

TypedArray ArrayLoader::EmptyArray(std::span<const uint32> dimensions) const {
    return cell::EmptyArray(m_type, dimensions);
}

uint64 ArrayLoader::Load(TypedArray &destination, std::span<const uint8> rawBytes, uint64 planeIndex,
                         std::error_code &error) const {
    error.clear();
    if (GetElementType(destination) != m_type) {
        devlog::error<grp::loader>("Destination holds {} elements, loader produces {}",
                                   ElementTypeName(GetElementType(destination)), ElementTypeName(m_type));
        error = LoaderError::ElementTypeMismatch;
        return 0;
    }

    const PlaneFormat format = m_metadata.GetPlaneFormat(planeIndex);
    devlog::debug<grp::loader>("Plane {}: {} bytes, {} bits per pixel, {} endian -> {}", planeIndex, rawBytes.size(),
                               format.bitsPerPixel, (format.littleEndian ? "little" : "big"), ElementTypeName(m_type));

    const uint64 count = Convert(destination, rawBytes, planeIndex, format.bitsPerPixel, format.littleEndian, error);
    if (error) {
        devlog::error<grp::loader>("Plane {} rejected: {}", planeIndex, error.message());
    }
    return count;
}

} // namespace tessera::cell
