#pragma once

/**
 * @file cog_reader.hpp
 * @brief Entry points decoding a Cloud-Optimized GeoTIFF from any RawReader
 *
 * Every entry point parses the directory chain again: nothing is kept between
 * calls except what the byte source caches itself (RangeCache keeps its chunks).
 *
 * @code{.cpp}
 * using namespace cogreader;
 *
 * RangeCache cache(CurlRangeFetcher("https://example.com/dem.tif"));
 *
 * auto info = decode_geo_info(cache);
 * auto overview = decode_level(cache, 2);
 * auto window = decode_level_sub_image(cache, 0, Rect{1024, 1024, 1536, 1536});
 * @endcode
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "decompressors.hpp"
#include "georeference.hpp"
#include "pixel_buffer.hpp"
#include "reader_base.hpp"
#include "tag_directory.hpp"
#include "tile_decoder.hpp"
#include "types/result.hpp"

namespace cogreader {

/// @brief Size and display range of a level, without pixel data
struct ImageConfig {
    std::optional<ColorModel> color_model;  ///< Empty unless the level is a grayscale integer image
    uint32_t width = 0;
    uint32_t height = 0;
};

/// Raster size of one level, {width, height}
struct OverviewInfo {
    std::array<uint32_t, 2> size{};
};

/// @brief Georeferencing summary of a file, in the spirit of gdalinfo's JSON output
struct GeoInfo {
    std::string data_type;                  ///< "UInt8", "UInt16", "Int8" or "Int16"
    std::array<uint32_t, 2> size{};         ///< Full resolution {width, height}
    GeoTransform geo_transform = kIdentityGeoTransform;
    std::string crs;
    double nodata = 0.0;                    ///< 0 when the file declares none
    std::vector<OverviewInfo> overviews;    ///< Every level, the full resolution one first

    /// @brief Geotransform of a level, pixel sizes scaled by the integer size ratio
    /// @retval Error::Code::InvalidLevel level is not an index into overviews
    [[nodiscard]] Result<GeoTransform> geotransform(std::size_t level) const noexcept;
};

/// @brief Parse the header and all directories of a file
template <RawReader Reader>
[[nodiscard]] Result<GeoTiffDocument> read_document(const Reader& reader) noexcept;

/// @brief Decode the whole full resolution image
template <typename DecompSpec = StandardDecompressors, RawReader Reader>
[[nodiscard]] Result<PixelBuffer> decode(const Reader& reader) noexcept;

/// @brief Decode the whole image of one level
/// @retval Error::Code::InvalidLevel level is not an index into the level list
template <typename DecompSpec = StandardDecompressors, RawReader Reader>
[[nodiscard]] Result<PixelBuffer> decode_level(const Reader& reader, std::size_t level) noexcept;

/**
 * @brief Decode the part of one level inside rect
 *
 * The result covers rect clipped to the level, addressed in level pixel coordinates.
 *
 * @retval Error::Code::InvalidLevel level is not an index into the level list
 * @retval Error::Code::OutOfBounds rect does not intersect the level
 * @see TileDecoder::decode() for the decoding errors
 */
template <typename DecompSpec = StandardDecompressors, RawReader Reader>
[[nodiscard]] Result<PixelBuffer> decode_level_sub_image(const Reader& reader, std::size_t level, const Rect& rect) noexcept;

/// @brief Color model and size of the full resolution image
template <RawReader Reader>
[[nodiscard]] Result<ImageConfig> decode_config(const Reader& reader) noexcept;

/// @brief Color model and size of one level
/// @retval Error::Code::InvalidLevel level is not an index into the level list
template <RawReader Reader>
[[nodiscard]] Result<ImageConfig> decode_config_level(const Reader& reader, std::size_t level) noexcept;

/**
 * @brief Georeferencing summary: data type, sizes, geotransform, CRS and nodata
 *
 * @retval Error::Code::UnsupportedFeature The full resolution sample type is not UInt8, UInt16, Int8 or Int16
 * @retval Error::Code::MissingGeoKeys The file carries no CRS parameters
 */
template <RawReader Reader, GeoKeyInterpreter Interpreter = EpsgGeoKeyInterpreter>
[[nodiscard]] Result<GeoInfo> decode_geo_info(const Reader& reader, const Interpreter& interpreter = Interpreter{}) noexcept;

} // namespace cogreader

#define COGREADER_COG_READER_HEADER
#include "impl/cog_reader_impl.hpp"
