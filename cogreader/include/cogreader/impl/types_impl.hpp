// Do not include this file directly. Include "cogreader/types.hpp" instead.

#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>

#ifndef COGREADER_TYPES_HEADER
#include "../types.hpp" // for linters
#endif

namespace cogreader {

// tiff_type_size / tiff_type_name

constexpr std::size_t tiff_type_size(TiffDataType type) noexcept {
    switch (type) {
        case TiffDataType::Byte:
        case TiffDataType::Ascii:
        case TiffDataType::SByte:
        case TiffDataType::Undefined:
            return 1;
        case TiffDataType::Short:
        case TiffDataType::SShort:
            return 2;
        case TiffDataType::Long:
        case TiffDataType::SLong:
        case TiffDataType::Float:
        case TiffDataType::IFD:
            return 4;
        case TiffDataType::Rational:
        case TiffDataType::SRational:
        case TiffDataType::Double:
            return 8;
        default:
            return 0;
    }
}

constexpr std::string_view tiff_type_name(TiffDataType type) noexcept {
    switch (type) {
        case TiffDataType::Byte:      return "BYTE";
        case TiffDataType::Ascii:     return "ASCII";
        case TiffDataType::Short:     return "SHORT";
        case TiffDataType::Long:      return "LONG";
        case TiffDataType::Rational:  return "RATIONAL";
        case TiffDataType::SByte:     return "SBYTE";
        case TiffDataType::Undefined: return "UNDEFINED";
        case TiffDataType::SShort:    return "SSHORT";
        case TiffDataType::SLong:     return "SLONG";
        case TiffDataType::SRational: return "SRATIONAL";
        case TiffDataType::Float:     return "FLOAT";
        case TiffDataType::Double:    return "DOUBLE";
        case TiffDataType::IFD:       return "IFD";
        default:                      return "UNKNOWN";
    }
}

constexpr std::string_view tag_name(uint16_t code) noexcept {
    switch (static_cast<TagCode>(code)) {
        case TagCode::NewSubfileType:            return "NewSubfileType";
        case TagCode::ImageWidth:                return "ImageWidth";
        case TagCode::ImageLength:               return "ImageLength";
        case TagCode::BitsPerSample:             return "BitsPerSample";
        case TagCode::Compression:               return "Compression";
        case TagCode::PhotometricInterpretation: return "PhotometricInterpretation";
        case TagCode::SamplesPerPixel:           return "SamplesPerPixel";
        case TagCode::PlanarConfiguration:       return "PlanarConfiguration";
        case TagCode::Predictor:                 return "Predictor";
        case TagCode::TileWidth:                 return "TileWidth";
        case TagCode::TileLength:                return "TileLength";
        case TagCode::TileOffsets:               return "TileOffsets";
        case TagCode::TileByteCounts:            return "TileByteCounts";
        case TagCode::SampleFormat:              return "SampleFormat";
        case TagCode::ModelPixelScale:           return "ModelPixelScale";
        case TagCode::ModelTiepoint:             return "ModelTiepoint";
        case TagCode::ModelTransformation:       return "ModelTransformation";
        case TagCode::GeoKeyDirectory:           return "GeoKeyDirectory";
        case TagCode::GeoDoubleParams:           return "GeoDoubleParams";
        case TagCode::GeoAsciiParams:            return "GeoAsciiParams";
        case TagCode::GDALMetadata:              return "GDALMetadata";
        case TagCode::GDALNoData:                return "GDALNoData";
    }
    return {};
}

// byteswap template

template <typename T>
constexpr T byteswap(T value) noexcept requires std::is_integral_v<T> {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        using U = std::make_unsigned_t<T>;
        U v = static_cast<U>(value);
        return static_cast<T>(static_cast<U>((v >> 8) | (v << 8)));
    } else if constexpr (sizeof(T) == 4) {
        using U = std::make_unsigned_t<T>;
        U v = static_cast<U>(value);
        return static_cast<T>(
            ((v & 0xFF000000u) >> 24) |
            ((v & 0x00FF0000u) >> 8)  |
            ((v & 0x0000FF00u) << 8)  |
            ((v & 0x000000FFu) << 24)
        );
    } else if constexpr (sizeof(T) == 8) {
        using U = std::make_unsigned_t<T>;
        U v = static_cast<U>(value);
        return static_cast<T>(
            ((v & 0xFF00000000000000ULL) >> 56) |
            ((v & 0x00FF000000000000ULL) >> 40) |
            ((v & 0x0000FF0000000000ULL) >> 24) |
            ((v & 0x000000FF00000000ULL) >> 8)  |
            ((v & 0x00000000FF000000ULL) << 8)  |
            ((v & 0x0000000000FF0000ULL) << 24) |
            ((v & 0x000000000000FF00ULL) << 40) |
            ((v & 0x00000000000000FFULL) << 56)
        );
    }
}

// convert_endianness template

template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept {
    if constexpr (SourceEndian != TargetEndian) {
        if constexpr (std::is_enum_v<T>) {
            value = static_cast<T>(byteswap(static_cast<std::underlying_type_t<T>>(value)));
        } else if constexpr (std::is_integral_v<T>) {
            value = byteswap(value);
        } else if constexpr (std::is_floating_point_v<T>) {
            if constexpr (sizeof(T) == 4) {
                value = std::bit_cast<T>(byteswap(std::bit_cast<uint32_t>(value)));
            } else if constexpr (sizeof(T) == 8) {
                value = std::bit_cast<T>(byteswap(std::bit_cast<uint64_t>(value)));
            }
        } else {
            static_assert(sizeof(T) == 0, "convert_endianness not specialized for this type");
        }
    }
}

template <typename T, std::endian SourceEndian>
inline T load_value(const std::byte* src) noexcept {
    T value;
    std::memcpy(&value, src, sizeof(T));
    convert_endianness<T, SourceEndian, std::endian::native>(value);
    return value;
}

template <typename T, std::endian TargetEndian>
inline void store_value(std::byte* dst, T value) noexcept {
    convert_endianness<T, std::endian::native, TargetEndian>(value);
    std::memcpy(dst, &value, sizeof(T));
}

// TiffHeader template implementations

template <std::endian StorageEndian>
constexpr bool TiffHeader<StorageEndian>::is_little_endian() const noexcept {
    return byte_order[0] == 'I' && byte_order[1] == 'I';
}

template <std::endian StorageEndian>
constexpr bool TiffHeader<StorageEndian>::is_big_endian() const noexcept {
    return byte_order[0] == 'M' && byte_order[1] == 'M';
}

template <std::endian StorageEndian>
inline bool TiffHeader<StorageEndian>::is_valid() const noexcept {
    uint16_t native_version = version;
    convert_endianness<uint16_t, StorageEndian, std::endian::native>(native_version);
    if constexpr (StorageEndian == std::endian::little) {
        return is_little_endian() && native_version == kClassicTiffVersion;
    } else {
        return is_big_endian() && native_version == kClassicTiffVersion;
    }
}

template <std::endian StorageEndian>
inline uint32_t TiffHeader<StorageEndian>::get_first_ifd_offset() const noexcept {
    uint32_t offset = first_ifd_offset;
    convert_endianness<uint32_t, StorageEndian, std::endian::native>(offset);
    return offset;
}

// TiffTag template implementations

template <std::endian StorageEndian>
inline uint16_t TiffTag<StorageEndian>::get_code() const noexcept {
    uint16_t value_code = code;
    convert_endianness<uint16_t, StorageEndian, std::endian::native>(value_code);
    return value_code;
}

template <std::endian StorageEndian>
inline TiffDataType TiffTag<StorageEndian>::get_datatype() const noexcept {
    TiffDataType type = datatype;
    convert_endianness<TiffDataType, StorageEndian, std::endian::native>(type);
    return type;
}

template <std::endian StorageEndian>
inline uint32_t TiffTag<StorageEndian>::get_count() const noexcept {
    uint32_t value_count = count;
    convert_endianness<uint32_t, StorageEndian, std::endian::native>(value_count);
    return value_count;
}

template <std::endian StorageEndian>
inline bool TiffTag<StorageEndian>::is_inline() const noexcept {
    return data_size() <= inline_bytecount_limit();
}

template <std::endian StorageEndian>
inline uint32_t TiffTag<StorageEndian>::get_offset() const noexcept {
    uint32_t value_offset = value.offset;
    convert_endianness<uint32_t, StorageEndian, std::endian::native>(value_offset);
    return value_offset;
}

template <std::endian StorageEndian>
inline std::size_t TiffTag<StorageEndian>::data_size() const noexcept {
    return static_cast<std::size_t>(get_count()) * tiff_type_size(get_datatype());
}

} // namespace cogreader
