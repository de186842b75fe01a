#pragma once

/**
 * @file tag_directory.hpp
 * @brief GeoTIFF directory model and the parser walking the IFD chain
 *
 * ## Layout
 *
 * A classic TIFF starts with an 8-byte header: the byte order mark ("II" or "MM"),
 * the version 42 and the offset of the first Image File Directory (IFD).
 * Each IFD holds a 16-bit entry count, that many 12-byte entries and the offset
 * of the next IFD (0 ends the chain).
 *
 * In a Cloud-Optimized GeoTIFF each IFD is one resolution level: the first one is
 * the full resolution image, the following ones are the overviews.
 *
 * ## Entry values
 *
 * An entry whose value fits in 4 bytes (count * type size) stores it inline; other
 * entries store the offset of the value. DirectoryEntry::location keeps that
 * distinction explicit and parsing::resolve_value() turns either into bytes with at
 * most one read.
 *
 * @code{.cpp}
 * using namespace cogreader;
 *
 * BufferReader reader(std::move(file_bytes));
 * auto document = parsing::parse_document(reader);
 * if (document) {
 *     for (const auto& level : document.value().levels) {
 *         std::cout << level.width << "x" << level.height << "\n";
 *     }
 * }
 * @endcode
 *
 * @note All functions are noexcept and use Result<T> for error handling
 */

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace cogreader {

/// Affine pixel to world mapping, GDAL order:
/// {origin x, pixel width, row rotation, origin y, column rotation, pixel height}
using GeoTransform = std::array<double, 6>;

/// Geotransform of a file without georeferencing tags
inline constexpr GeoTransform kIdentityGeoTransform = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};

/// Value bytes stored in the entry itself, in file byte order
struct InlineValue {
    std::array<std::byte, 4> bytes{};
    std::size_t size = 0;   ///< Meaningful bytes at the start of bytes
};

/// Value stored elsewhere in the file
struct OutOfLineValue {
    uint32_t offset = 0;
    std::size_t size = 0;
};

/// Where the value of a directory entry lives
using TagValueLocation = std::variant<InlineValue, OutOfLineValue>;

/// One 12-byte IFD record, decoded to native byte order
struct DirectoryEntry {
    uint16_t code = 0;
    TiffDataType datatype = TiffDataType::Undefined;
    uint32_t count = 0;
    TagValueLocation location;

    [[nodiscard]] std::size_t data_size() const noexcept {
        return static_cast<std::size_t>(count) * tiff_type_size(datatype);
    }
};

/// One raw GeoKey record of the GeoKeyDirectory tag
struct GeoKeyEntry {
    uint16_t key_id = 0;
    uint16_t tag_location = 0;  ///< 0 when value_offset is the value, else the tag holding it
    uint16_t count = 0;
    uint16_t value_offset = 0;

    constexpr bool operator==(const GeoKeyEntry&) const noexcept = default;
};

/// Geometry and encoding of one resolution level (one IFD)
struct RasterLevel {
    uint32_t new_subfile_type = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t tile_width = 0;
    uint32_t tile_height = 0;
    CompressionScheme compression = CompressionScheme::None;
    Predictor predictor = Predictor::None;
    PhotometricInterpretation photometric = PhotometricInterpretation::MinIsBlack;
    uint16_t samples_per_pixel = 1;
    uint16_t bits_per_sample = 0;
    SampleFormat sample_format = SampleFormat::UnsignedInt;
    std::vector<uint32_t> tile_offsets;
    std::vector<uint32_t> tile_byte_counts;
    std::vector<uint16_t> unrecognized_tags;  ///< Codes of the entries this parser does not consume

    /// Number of tile columns, 0 for an untiled level
    [[nodiscard]] uint32_t tiles_across() const noexcept {
        return tile_width == 0 ? 0 : (width + tile_width - 1) / tile_width;
    }

    /// Number of tile rows, 0 for an untiled level
    [[nodiscard]] uint32_t tiles_down() const noexcept {
        return tile_height == 0 ? 0 : (height + tile_height - 1) / tile_height;
    }
};

/// Everything the decoder knows about a file after walking its directories
struct GeoTiffDocument {
    ByteOrder byte_order = ByteOrder::LittleEndian;
    std::vector<RasterLevel> levels;                ///< In chain order, index 0 is full resolution
    GeoTransform geotransform = kIdentityGeoTransform;
    std::optional<double> nodata;                   ///< Empty when absent, 0 when unparsable
    std::string gdal_metadata;
    std::optional<std::vector<double>> geo_double_params;
    std::optional<std::string> geo_ascii_params;
    std::vector<GeoKeyEntry> geokeys;
};

namespace parsing {

/// Byte order and first IFD offset of a file
struct FileHeader {
    ByteOrder byte_order = ByteOrder::LittleEndian;
    uint32_t first_ifd_offset = 0;
};

/// Largest out-of-line value the parser accepts for one entry
inline constexpr std::size_t kMaxTagValueBytes = std::size_t{256} << 20;

/**
 * @brief Read and check the 8-byte file header
 *
 * @retval Error::Code::InvalidHeader The byte order mark is neither "II" nor "MM", or the version is not 42
 * @retval Error::Code::UnexpectedEndOfFile The file is shorter than a header
 */
template <RawReader Reader>
[[nodiscard]] Result<FileHeader> read_file_header(const Reader& reader) noexcept;

/// @brief Decode the fields of an on-disk entry and locate its value
template <std::endian SourceEndian>
[[nodiscard]] DirectoryEntry decode_entry(const TiffTag<SourceEndian>& tag) noexcept;

/**
 * @brief Fetch the bytes of an entry value, still in file byte order
 *
 * Inline values are copied from the entry, out-of-line values are read with a single
 * read_into() call.
 *
 * @retval Error::Code::InvalidTag The value is larger than kMaxTagValueBytes
 * @retval Error::Code::UnexpectedEndOfFile The value runs past the end of the file
 */
template <RawReader Reader>
[[nodiscard]] Result<std::vector<std::byte>> resolve_value(const Reader& reader, const DirectoryEntry& entry) noexcept;

/// @brief Convert count values of type T stored in SourceEndian order
/// @note bytes must hold at least count * sizeof(T) bytes
template <typename T, std::endian SourceEndian>
[[nodiscard]] std::vector<T> decode_values(std::span<const std::byte> bytes, std::size_t count);

/**
 * @brief Parse one IFD into a new RasterLevel appended to document.levels
 *
 * Georeferencing tags (tiepoint, pixel scale, GeoKey directory and parameters,
 * GDAL nodata and metadata) are taken from the first IFD only.
 *
 * @param reader Byte source
 * @param offset Position of the IFD entry count
 * @param document Document being assembled
 * @return Offset of the next IFD, 0 at the end of the chain
 *
 * @retval Error::Code::InvalidTag A consumed tag has an invalid count or value
 * @retval Error::Code::InvalidTagType A consumed tag has an unexpected data type
 * @retval Error::Code::UnsupportedFeature Planar configuration other than chunky,
 *         predictor other than 1 or 2, or a ModelTransformation tag
 */
template <std::endian SourceEndian, RawReader Reader>
[[nodiscard]] Result<uint32_t> parse_ifd(const Reader& reader, uint32_t offset, GeoTiffDocument& document) noexcept;

/**
 * @brief Walk the whole IFD chain
 *
 * @retval Error::Code::InvalidHeader Bad header
 * @retval Error::Code::InvalidFormat The file has no IFD, or the chain loops
 * @return The assembled document; level i is the i-th IFD of the chain
 */
template <RawReader Reader>
[[nodiscard]] Result<GeoTiffDocument> parse_document(const Reader& reader) noexcept;

} // namespace parsing

} // namespace cogreader

#define COGREADER_TAG_DIRECTORY_HEADER
#include "impl/tag_directory_impl.hpp"
