#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>

namespace cogreader {

/// @brief Byte order of a TIFF file, fixed by its first two bytes
enum class ByteOrder : uint8_t {
    LittleEndian, ///< "II"
    BigEndian     ///< "MM"
};

/// @brief TIFF data type enumeration (Classic TIFF)
enum class TiffDataType : uint16_t {
    Byte      = 1,  ///< 8-bit unsigned integer
    Ascii     = 2,  ///< 8-bit byte containing a 7-bit ASCII code
    Short     = 3,  ///< 16-bit unsigned integer
    Long      = 4,  ///< 32-bit unsigned integer
    Rational  = 5,  ///< Two LONGs: numerator, denominator
    SByte     = 6,  ///< 8-bit signed integer
    Undefined = 7,  ///< 8-bit byte (uninterpreted)
    SShort    = 8,  ///< 16-bit signed integer
    SLong     = 9,  ///< 32-bit signed integer
    SRational = 10, ///< Two SLONGs: numerator, denominator
    Float     = 11, ///< Single precision (4-byte) IEEE format
    Double    = 12, ///< Double precision (8-byte) IEEE format
    IFD       = 13  ///< 32-bit IFD offset, equivalent to Long
};

/// @brief Get size in bytes of a TIFF data type
/// @param type The TIFF data type
/// @return Size in bytes, or 0 for unknown types
[[nodiscard]] constexpr std::size_t tiff_type_size(TiffDataType type) noexcept;

/// @brief Human readable name of a TIFF data type ("SHORT", "DOUBLE", ...)
[[nodiscard]] constexpr std::string_view tiff_type_name(TiffDataType type) noexcept;

/// Tag codes consumed by the COG decoder
enum class TagCode : uint16_t {
    NewSubfileType            = 254,
    ImageWidth                = 256,
    ImageLength               = 257,
    BitsPerSample             = 258,
    Compression               = 259,
    PhotometricInterpretation = 262,
    SamplesPerPixel           = 277,
    PlanarConfiguration       = 284,
    Predictor                 = 317,
    TileWidth                 = 322,
    TileLength                = 323,
    TileOffsets               = 324,
    TileByteCounts            = 325,
    SampleFormat              = 339,
    ModelPixelScale           = 33550,
    ModelTiepoint             = 33922,
    ModelTransformation       = 34264,
    GeoKeyDirectory           = 34735,
    GeoDoubleParams           = 34736,
    GeoAsciiParams            = 34737,
    GDALMetadata              = 42112,
    GDALNoData                = 42113
};

/// @brief Name of a consumed tag, or an empty view for any other code
/// @note The full TIFF tag dictionary is not carried by this library
[[nodiscard]] constexpr std::string_view tag_name(uint16_t code) noexcept;

/// Compression schemes understood by the decoder
enum class CompressionScheme : uint16_t {
    Unspecified    = 0,     ///< Missing value, treated as None
    None           = 1,     ///< No compression
    LZW            = 5,     ///< Lempel-Ziv-Welch
    Deflate_Adobe  = 8,     ///< Adobe-style Deflate
    PackBits       = 32773, ///< PackBits compression
    Deflate        = 32946  ///< PKZIP-style Deflate
};

enum class SampleFormat : uint16_t {
    UnsignedInt   = 1, ///< Unsigned integer
    SignedInt     = 2, ///< Signed integer
    IEEEFloat     = 3, ///< IEEE floating point
    Undefined     = 4  ///< Undefined/uninterpreted
};

enum class PhotometricInterpretation : uint16_t {
    MinIsWhite    = 0, ///< Minimum value is white
    MinIsBlack    = 1, ///< Minimum value is black
    RGB           = 2, ///< RGB color space
    Palette       = 3  ///< Palette/indexed color
};

enum class Predictor : uint16_t {
    None          = 1, ///< No predictor
    Horizontal    = 2  ///< Horizontal differencing
};

enum class PlanarConfiguration : uint16_t {
    Chunky = 1, ///< Samples of one pixel stored together
    Planar = 2  ///< One plane per sample
};

/// @brief Byte-swap an integral value
/// @tparam T Integral type to swap
/// @note For 1-byte types, returns the value unchanged
template <typename T>
[[nodiscard]] constexpr T byteswap(T value) noexcept requires std::is_integral_v<T>;

/// @brief Convert a value from source endianness to target endianness in place
/// @note Handles integral and floating point types
template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept;

/// @brief Read a value of type T stored in SourceEndian order at src
template <typename T, std::endian SourceEndian>
[[nodiscard]] T load_value(const std::byte* src) noexcept;

/// @brief Write a value of type T at dst in TargetEndian order
template <typename T, std::endian TargetEndian>
void store_value(std::byte* dst, T value) noexcept;

// MSVC ignores the packed attribute
#pragma pack(push, 1)

/// @brief TIFF file header structure (Classic TIFF)
/// @tparam StorageEndian Endianness of the TIFF file
/// @details Contains the byte order mark, version (42 for Classic TIFF),
/// and offset to the first IFD. Always 8 bytes.
template <std::endian StorageEndian>
struct [[gnu::packed]] TiffHeader {
    std::array<char, 2> byte_order;  ///< "II" for little-endian, "MM" for big-endian
    uint16_t version;                ///< Must be 42 (0x002A) for classic TIFF
    uint32_t first_ifd_offset;       ///< Offset to first IFD from start of file

    [[nodiscard]] constexpr bool is_little_endian() const noexcept;

    [[nodiscard]] constexpr bool is_big_endian() const noexcept;

    /// @brief Check the byte order mark matches StorageEndian and the version is 42
    [[nodiscard]] bool is_valid() const noexcept;

    /// @brief Get the first IFD offset in native byte order
    [[nodiscard]] uint32_t get_first_ifd_offset() const noexcept;
};

static_assert(sizeof(TiffHeader<std::endian::little>) == 8, "TiffHeader must be 8 bytes");
static_assert(sizeof(TiffHeader<std::endian::big>) == 8, "TiffHeader must be 8 bytes");

/// @brief Value field of a directory entry: the value itself or an offset to it
union [[gnu::packed]] TagValue {
    uint32_t offset;                 ///< Offset to data if count*size > 4 bytes
    std::array<std::byte, 4> raw;    ///< Inline bytes, still in file order
};

static_assert(sizeof(TagValue) == 4, "TagValue must be 4 bytes");

/// @brief TIFF tag entry in IFD (Classic TIFF)
/// @tparam StorageEndian Endianness of the TIFF file
/// @details Each IFD entry is 12 bytes and contains tag code, data type, count, and value/offset.
template <std::endian StorageEndian>
struct [[gnu::packed]] TiffTag {
    uint16_t code;         ///< Tag identifier (see TagCode enum)
    TiffDataType datatype; ///< Data type of the tag value
    uint32_t count;        ///< Number of values of the specified type
    TagValue value;        ///< Value or offset to value

    /// @brief Maximum byte count stored inline (4 for Classic TIFF)
    [[nodiscard]] static constexpr std::size_t inline_bytecount_limit() noexcept { return 4; }

    [[nodiscard]] uint16_t get_code() const noexcept;

    [[nodiscard]] TiffDataType get_datatype() const noexcept;

    [[nodiscard]] uint32_t get_count() const noexcept;

    /// @brief Check if value is stored inline or as an offset
    [[nodiscard]] bool is_inline() const noexcept;

    /// @brief Offset to the out-of-line data, native byte order
    /// @note Only meaningful when !is_inline()
    [[nodiscard]] uint32_t get_offset() const noexcept;

    /// @brief Total size of the data in bytes (count * size_of_type)
    [[nodiscard]] std::size_t data_size() const noexcept;
};

static_assert(sizeof(TiffTag<std::endian::little>) == 12, "TiffTag must be 12 bytes");
static_assert(sizeof(TiffTag<std::endian::big>) == 12, "TiffTag must be 12 bytes");

#pragma pack(pop) // End of packed structures

/// Classic TIFF version number
inline constexpr uint16_t kClassicTiffVersion = 42;

} // namespace cogreader

#define COGREADER_TYPES_HEADER
#include "impl/types_impl.hpp"
