#pragma once

/**
 * @file tile_decoder.hpp
 * @brief Decoding of the tiles of one resolution level overlapping a pixel window
 *
 * ## Decoding Pipeline
 *
 * For each tile overlapping the window:
 * 1. Read the TileByteCounts[i] bytes at TileOffsets[i] from the byte source
 * 2. Decompress them into a tile-sized scratch buffer
 * 3. Reverse the horizontal predictor over the complete rows (8 or 16 bits)
 * 4. Unpack the samples of the tile/window overlap in the file byte order
 *
 * Tiles are padded to the full tile size at the right and bottom edges of the
 * image, so the row stride of a decoded tile is always the tile width.
 *
 * ## Thread Safety
 *
 * TileDecoder keeps scratch buffers and is NOT thread-safe. Use one instance per
 * thread; the byte source itself may be shared.
 *
 * @code{.cpp}
 * using namespace cogreader;
 *
 * TileDecoder<StandardDecompressors> decoder;
 * const RasterLevel& level = document.levels[0];
 * auto window = decoder.decode(reader, level, document.byte_order, Rect{0, 0, 512, 512}, document.nodata);
 * if (window) {
 *     std::visit([](const auto& image) { use(image); }, window.value());
 * }
 * @endcode
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "decompressors.hpp"
#include "lowlevel/predictor.hpp"
#include "pixel_buffer.hpp"
#include "reader_base.hpp"
#include "tag_directory.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace cogreader {

/// @brief Tile layout of a level
struct TileGrid {
    uint32_t tile_width = 0;
    uint32_t tile_height = 0;
    uint32_t tiles_across = 0;
    uint32_t tiles_down = 0;

    [[nodiscard]] std::size_t tile_count() const noexcept {
        return static_cast<std::size_t>(tiles_across) * tiles_down;
    }

    /// Row-major index into TileOffsets / TileByteCounts
    [[nodiscard]] std::size_t tile_index(uint32_t column, uint32_t row) const noexcept {
        return static_cast<std::size_t>(row) * tiles_across + column;
    }

    /// Pixels covered by a tile, including its padding past the image edge
    [[nodiscard]] Rect tile_bounds(uint32_t column, uint32_t row) const noexcept {
        const int64_t x = static_cast<int64_t>(column) * tile_width;
        const int64_t y = static_cast<int64_t>(row) * tile_height;
        return Rect{x, y, x + tile_width, y + tile_height};
    }
};

/**
 * @brief Check a level can be decoded and compute its tile grid
 *
 * @retval Error::Code::InvalidFormat Zero image size, missing TileLength, too few
 *         tile offsets or byte counts, or BitsPerSample of 0
 * @retval Error::Code::UnsupportedFeature Strip layout (no TileWidth), more than one
 *         sample per pixel, or a bit depth other than 8 and 16
 */
[[nodiscard]] Result<TileGrid> tile_grid_of(const RasterLevel& level) noexcept;

/// @brief Display range of a level, when it is a grayscale (BlackIsZero) integer image
[[nodiscard]] std::optional<ColorModel> color_model_of(const RasterLevel& level) noexcept;

/**
 * @brief Tile decoder for one resolution level at a time
 *
 * @tparam DecompSpec Decompressors available (e.g. StandardDecompressors)
 */
template <typename DecompSpec = StandardDecompressors>
    requires ValidDecompressorSpec<DecompSpec>
class TileDecoder {
private:
    DecompressorStorage<DecompSpec> decompressors_;
    mutable std::vector<std::byte> compressed_;
    mutable std::vector<std::byte> decoded_;

    template <std::endian SourceEndian, RawReader Reader>
    [[nodiscard]] Result<std::span<const std::byte>> decode_tile_impl(
        const Reader& reader,
        const RasterLevel& level,
        const TileGrid& grid,
        std::size_t tile_index) const noexcept;

    template <std::endian SourceEndian, RawReader Reader>
    [[nodiscard]] Result<void> decode_window_impl(
        const Reader& reader,
        const RasterLevel& level,
        const TileGrid& grid,
        PixelBuffer& output) const noexcept;

public:
    TileDecoder() = default;

    TileDecoder(const TileDecoder&) = delete;
    TileDecoder& operator=(const TileDecoder&) = delete;
    TileDecoder(TileDecoder&&) noexcept = default;
    TileDecoder& operator=(TileDecoder&&) noexcept = default;

    /**
     * @brief Fetch, decompress and un-predict one tile
     *
     * @return Decoded bytes in file byte order, valid until the next call on this decoder.
     *         Shorter than a full tile when the compressed data ends early.
     *
     * @retval Error::Code::OutOfBounds tile_index is outside the grid
     * @retval Error::Code::UnsupportedFeature Compression not handled by DecompSpec (checked before any read)
     * @retval Error::Code::CompressionError Corrupt compressed data
     * @retval Error::Code::UnexpectedEndOfFile / TransportError The byte source failed
     */
    template <RawReader Reader>
    [[nodiscard]] Result<std::span<const std::byte>> decode_tile(
        const Reader& reader,
        const RasterLevel& level,
        ByteOrder byte_order,
        std::size_t tile_index) const noexcept;

    /**
     * @brief Decode the part of a level overlapping window
     *
     * The returned buffer covers window clipped to the image, in absolute pixel
     * coordinates, typed by the level's sample type.
     *
     * @retval Error::Code::OutOfBounds window does not intersect the image
     * @retval Error::Code::InsufficientData A tile holds fewer samples than its part of the window
     * @retval Error::Code::UnsupportedFeature Photometric other than BlackIsZero, or a
     *         sample format other than integer
     * @see tile_grid_of() for the level checks run first
     */
    template <RawReader Reader>
    [[nodiscard]] Result<PixelBuffer> decode(
        const Reader& reader,
        const RasterLevel& level,
        ByteOrder byte_order,
        const Rect& window,
        std::optional<double> nodata = std::nullopt) const noexcept;
};

} // namespace cogreader

#define COGREADER_TILE_DECODER_HEADER
#include "impl/tile_decoder_impl.hpp"
