// Do not include this file directly. Include "cogreader/tile_decoder.hpp" instead.

#pragma once

#include <algorithm>
#include <new>
#include <string>
#include <type_traits>
#include <variant>
#include "../logging.hpp"

#ifndef COGREADER_TILE_DECODER_HEADER
#include "../tile_decoder.hpp" // for linters
#endif

namespace cogreader {

inline Result<TileGrid> tile_grid_of(const RasterLevel& level) noexcept {
    if (level.width == 0 || level.height == 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat,
                   "Unexpected image dimensions " + std::to_string(level.width) + "x" + std::to_string(level.height));
    }
    if (level.tile_width == 0) [[unlikely]] {
        return Err(Error::Code::UnsupportedFeature, "Strip layout is not supported, the level has no TileWidth");
    }
    if (level.tile_height == 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat, "TileWidth is set but TileLength is missing");
    }

    TileGrid grid{level.tile_width, level.tile_height, level.tiles_across(), level.tiles_down()};

    const std::size_t needed = grid.tile_count();
    if (level.tile_offsets.size() < needed || level.tile_byte_counts.size() < needed) [[unlikely]] {
        return Err(Error::Code::InvalidFormat,
                   "Inconsistent header: " + std::to_string(needed) + " tiles, but " +
                   std::to_string(level.tile_offsets.size()) + " offsets and " +
                   std::to_string(level.tile_byte_counts.size()) + " byte counts");
    }

    if (level.bits_per_sample == 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat, "BitsPerSample must not be 0");
    }
    if (level.bits_per_sample != 8 && level.bits_per_sample != 16) [[unlikely]] {
        return Err(Error::Code::UnsupportedFeature,
                   "BitsPerSample of " + std::to_string(level.bits_per_sample) + " not supported");
    }
    if (level.samples_per_pixel != 1) [[unlikely]] {
        return Err(Error::Code::UnsupportedFeature,
                   std::to_string(level.samples_per_pixel) + " samples per pixel not supported, only single band images");
    }
    return Ok(grid);
}

inline std::optional<ColorModel> color_model_of(const RasterLevel& level) noexcept {
    if (level.photometric != PhotometricInterpretation::MinIsBlack) {
        return std::nullopt;
    }
    auto type = sample_type_for(level.bits_per_sample, level.sample_format);
    if (!type) {
        return std::nullopt;
    }
    return color_model_for(type.value());
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
template <std::endian SourceEndian, RawReader Reader>
Result<std::span<const std::byte>> TileDecoder<DecompSpec>::decode_tile_impl(
    const Reader& reader,
    const RasterLevel& level,
    const TileGrid& grid,
    std::size_t tile_index) const noexcept {

    if (tile_index >= grid.tile_count()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Tile " + std::to_string(tile_index) + " outside of a grid of " +
                   std::to_string(grid.tile_count()) + " tiles");
    }
    if (!decompressors_.supports(level.compression)) [[unlikely]] {
        return Err(Error::Code::UnsupportedFeature,
                   "Compression value " + std::to_string(static_cast<uint16_t>(level.compression)) + " not supported");
    }

    const std::size_t offset = level.tile_offsets[tile_index];
    const std::size_t byte_count = level.tile_byte_counts[tile_index];
    const std::size_t bytes_per_sample = level.bits_per_sample / 8;
    const std::size_t tile_bytes = static_cast<std::size_t>(grid.tile_width) * grid.tile_height * bytes_per_sample;

    try {
        compressed_.resize(byte_count);
        decoded_.resize(tile_bytes);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::InvalidArgument,
                   "Cannot allocate buffers for tile " + std::to_string(tile_index));
    }

    if (auto r = reader.read_into(compressed_.data(), offset, byte_count); !r) {
        return Err(r.error().code,
                   "Failed to read tile " + std::to_string(tile_index) + " (" + std::to_string(byte_count) +
                   " bytes at offset " + std::to_string(offset) + "): " + r.error().message);
    }

    auto produced = decompressors_.decompress(
        std::span<std::byte>(decoded_), std::span<const std::byte>(compressed_), level.compression);
    if (!produced) {
        return Err(produced.error().code,
                   "Tile " + std::to_string(tile_index) + ": " + produced.error().message);
    }
    auto decoded = std::span<std::byte>(decoded_.data(), produced.value());

    if (level.predictor == Predictor::Horizontal) {
        auto r = predictor::reverse_horizontal<SourceEndian>(decoded, grid.tile_width, grid.tile_height, level.bits_per_sample);
        if (!r) {
            return r.error();
        }
    }
    return Ok(std::span<const std::byte>(decoded));
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
template <RawReader Reader>
Result<std::span<const std::byte>> TileDecoder<DecompSpec>::decode_tile(
    const Reader& reader,
    const RasterLevel& level,
    ByteOrder byte_order,
    std::size_t tile_index) const noexcept {

    auto grid = tile_grid_of(level);
    if (!grid) {
        return grid.error();
    }
    if (byte_order == ByteOrder::LittleEndian) {
        return decode_tile_impl<std::endian::little>(reader, level, grid.value(), tile_index);
    }
    return decode_tile_impl<std::endian::big>(reader, level, grid.value(), tile_index);
}

namespace tile_detail {

/// Copy the samples of tile lying in target into image
template <std::endian SourceEndian, GraySample T>
[[nodiscard]] Result<void> unpack_tile(
    std::span<const std::byte> tile,
    const Rect& tile_rect,
    const Rect& target,
    std::size_t tile_index,
    GrayImage<T>& image) noexcept {

    const std::size_t stride = static_cast<std::size_t>(tile_rect.width());
    for (int64_t y = target.min_y; y < target.max_y; ++y) {
        const std::size_t first = static_cast<std::size_t>(y - tile_rect.min_y) * stride +
                                  static_cast<std::size_t>(target.min_x - tile_rect.min_x);
        const std::size_t count = static_cast<std::size_t>(target.width());
        if ((first + count) * sizeof(T) > tile.size()) [[unlikely]] {
            return Err(Error::Code::InsufficientData,
                       "Not enough pixel data in tile " + std::to_string(tile_index) + ": " +
                       std::to_string(tile.size()) + " bytes decoded, row " + std::to_string(y) +
                       " needs " + std::to_string((first + count) * sizeof(T)));
        }
        auto row = image.row(y).subspan(static_cast<std::size_t>(target.min_x - image.bounds().min_x), count);
        const std::byte* src = tile.data() + first * sizeof(T);
        if constexpr (sizeof(T) == 1) {
            for (std::size_t x = 0; x < count; ++x) {
                row[x] = static_cast<T>(src[x]);
            }
        } else {
            for (std::size_t x = 0; x < count; ++x) {
                row[x] = static_cast<T>(load_value<uint16_t, SourceEndian>(src + 2 * x));
            }
        }
    }
    return Ok();
}

} // namespace tile_detail

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
template <std::endian SourceEndian, RawReader Reader>
Result<void> TileDecoder<DecompSpec>::decode_window_impl(
    const Reader& reader,
    const RasterLevel& level,
    const TileGrid& grid,
    PixelBuffer& output) const noexcept {

    const Rect window = bounds_of(output);
    const auto first_column = static_cast<uint32_t>(window.min_x / grid.tile_width);
    const auto last_column = static_cast<uint32_t>((window.max_x - 1) / grid.tile_width);
    const auto first_row = static_cast<uint32_t>(window.min_y / grid.tile_height);
    const auto last_row = static_cast<uint32_t>((window.max_y - 1) / grid.tile_height);

    logger()->debug("Decoding tiles [{}, {}] x [{}, {}] for window ({}, {})-({}, {})",
                    first_column, last_column, first_row, last_row,
                    window.min_x, window.min_y, window.max_x, window.max_y);

    for (uint32_t row = first_row; row <= last_row; ++row) {
        for (uint32_t column = first_column; column <= last_column; ++column) {
            const std::size_t index = grid.tile_index(column, row);
            auto tile = decode_tile_impl<SourceEndian>(reader, level, grid, index);
            if (!tile) {
                return tile.error();
            }

            const Rect tile_rect = grid.tile_bounds(column, row);
            const Rect target = tile_rect.intersect(window);
            auto unpacked = std::visit([&](auto& image) {
                return tile_detail::unpack_tile<SourceEndian>(tile.value(), tile_rect, target, index, image);
            }, output);
            if (!unpacked) {
                return unpacked.error();
            }
        }
    }
    return Ok();
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
template <RawReader Reader>
Result<PixelBuffer> TileDecoder<DecompSpec>::decode(
    const Reader& reader,
    const RasterLevel& level,
    ByteOrder byte_order,
    const Rect& window,
    std::optional<double> nodata) const noexcept {

    auto grid = tile_grid_of(level);
    if (!grid) {
        return grid.error();
    }

    const Rect clipped = Rect::from_size(level.width, level.height).intersect(window);
    if (clipped.empty()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds, "The rectangle provided does not intersect the image");
    }

    if (level.photometric != PhotometricInterpretation::MinIsBlack) [[unlikely]] {
        return Err(Error::Code::UnsupportedFeature,
                   "Photometric interpretation " + std::to_string(static_cast<uint16_t>(level.photometric)) +
                   " not supported, only BlackIsZero");
    }
    auto sample_type = sample_type_for(level.bits_per_sample, level.sample_format);
    if (!sample_type) {
        return sample_type.error();
    }
    if (!decompressors_.supports(level.compression)) [[unlikely]] {
        return Err(Error::Code::UnsupportedFeature,
                   "Compression value " + std::to_string(static_cast<uint16_t>(level.compression)) + " not supported");
    }

    std::optional<PixelBuffer> output;
    try {
        output.emplace(make_pixel_buffer(sample_type.value(), clipped, nodata));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::InvalidArgument,
                   "Cannot allocate a " + std::to_string(clipped.width()) + "x" + std::to_string(clipped.height()) +
                   " " + std::string(sample_type_name(sample_type.value())) + " buffer");
    }

    Result<void> filled = byte_order == ByteOrder::LittleEndian
        ? decode_window_impl<std::endian::little>(reader, level, grid.value(), *output)
        : decode_window_impl<std::endian::big>(reader, level, grid.value(), *output);
    if (!filled) {
        return filled.error();
    }
    return Ok(std::move(*output));
}

} // namespace cogreader
