// Do not include this file directly. Include "cogreader/cog_reader.hpp" instead.

#pragma once

#include <string>
#include <utility>

#ifndef COGREADER_COG_READER_HEADER
#include "../cog_reader.hpp" // for linters
#endif

namespace cogreader {

namespace reader_detail {

[[nodiscard]] inline Result<const RasterLevel*> level_at(const GeoTiffDocument& document, std::size_t level) noexcept {
    if (level >= document.levels.size()) [[unlikely]] {
        return Err(Error::Code::InvalidLevel,
                   "Level " + std::to_string(level) + " not in this file (" +
                   std::to_string(document.levels.size()) + " levels)");
    }
    return Ok(&document.levels[level]);
}

} // namespace reader_detail

inline Result<GeoTransform> GeoInfo::geotransform(std::size_t level) const noexcept {
    if (level >= overviews.size()) [[unlikely]] {
        return Err(Error::Code::InvalidLevel,
                   "Level " + std::to_string(level) + " not in this file (" +
                   std::to_string(overviews.size()) + " levels)");
    }
    if (level == 0) {
        return Ok(geo_transform);
    }
    const auto& target = overviews[level].size;
    return scale_geotransform(geo_transform, size[0], size[1], target[0], target[1]);
}

template <RawReader Reader>
Result<GeoTiffDocument> read_document(const Reader& reader) noexcept {
    return parsing::parse_document(reader);
}

template <typename DecompSpec, RawReader Reader>
Result<PixelBuffer> decode_level_sub_image(const Reader& reader, std::size_t level, const Rect& rect) noexcept {
    auto document = read_document(reader);
    if (!document) {
        return document.error();
    }
    auto raster = reader_detail::level_at(document.value(), level);
    if (!raster) {
        return raster.error();
    }
    TileDecoder<DecompSpec> decoder;
    return decoder.decode(reader, *raster.value(), document.value().byte_order, rect, document.value().nodata);
}

template <typename DecompSpec, RawReader Reader>
Result<PixelBuffer> decode_level(const Reader& reader, std::size_t level) noexcept {
    auto document = read_document(reader);
    if (!document) {
        return document.error();
    }
    auto raster = reader_detail::level_at(document.value(), level);
    if (!raster) {
        return raster.error();
    }
    const Rect whole = Rect::from_size(raster.value()->width, raster.value()->height);
    TileDecoder<DecompSpec> decoder;
    return decoder.decode(reader, *raster.value(), document.value().byte_order, whole, document.value().nodata);
}

template <typename DecompSpec, RawReader Reader>
Result<PixelBuffer> decode(const Reader& reader) noexcept {
    return decode_level<DecompSpec>(reader, 0);
}

template <RawReader Reader>
Result<ImageConfig> decode_config_level(const Reader& reader, std::size_t level) noexcept {
    auto document = read_document(reader);
    if (!document) {
        return document.error();
    }
    auto raster = reader_detail::level_at(document.value(), level);
    if (!raster) {
        return raster.error();
    }
    const RasterLevel& desc = *raster.value();
    return Ok(ImageConfig{color_model_of(desc), desc.width, desc.height});
}

template <RawReader Reader>
Result<ImageConfig> decode_config(const Reader& reader) noexcept {
    return decode_config_level(reader, 0);
}

template <RawReader Reader, GeoKeyInterpreter Interpreter>
Result<GeoInfo> decode_geo_info(const Reader& reader, const Interpreter& interpreter) noexcept {
    auto document = read_document(reader);
    if (!document) {
        return document.error();
    }
    const GeoTiffDocument& doc = document.value();
    const RasterLevel& full = doc.levels.front();

    auto sample_type = sample_type_for(full.bits_per_sample, full.sample_format);
    if (!sample_type) {
        return sample_type.error();
    }
    auto crs = resolve_crs(doc, interpreter);
    if (!crs) {
        return crs.error();
    }

    GeoInfo info;
    info.data_type = std::string(sample_type_name(sample_type.value()));
    info.size = {full.width, full.height};
    info.geo_transform = doc.geotransform;
    info.crs = std::move(crs).value();
    info.nodata = doc.nodata.value_or(0.0);
    info.overviews.reserve(doc.levels.size());
    for (const auto& level : doc.levels) {
        info.overviews.push_back(OverviewInfo{{level.width, level.height}});
    }
    return Ok(std::move(info));
}

} // namespace cogreader
