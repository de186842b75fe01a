// Do not include this file directly. Include "cogreader/georeference.hpp" instead.

#pragma once

#include <algorithm>
#include <initializer_list>
#include <string>

#ifndef COGREADER_GEOREFERENCE_HEADER
#include "../georeference.hpp" // for linters
#endif

namespace cogreader {

inline Result<std::string> EpsgGeoKeyInterpreter::crs(
    std::span<const GeoKeyEntry> keys,
    [[maybe_unused]] std::span<const double> double_params,
    [[maybe_unused]] std::string_view ascii_params) const noexcept {

    for (GeoKey wanted : {GeoKey::ProjectedCSType, GeoKey::GeographicType}) {
        auto it = std::find_if(keys.begin(), keys.end(), [wanted](const GeoKeyEntry& key) {
            return key.key_id == static_cast<uint16_t>(wanted);
        });
        if (it == keys.end()) {
            continue;
        }
        // Short values are stored in value_offset itself
        if (it->tag_location != 0 || it->count != 1) [[unlikely]] {
            return Err(Error::Code::InvalidTag,
                       "GeoKey " + std::to_string(it->key_id) + " is not an inline SHORT value");
        }
        if (it->value_offset == kUserDefinedGeoKeyValue) {
            return Err(Error::Code::UnsupportedFeature,
                       "User-defined CRS (GeoKey " + std::to_string(it->key_id) + ") cannot be rendered as an EPSG code");
        }
        return Ok("EPSG:" + std::to_string(it->value_offset));
    }
    return Err(Error::Code::MissingGeoKeys, "No ProjectedCSType or GeographicType GeoKey");
}

inline Result<GeoTransform> scale_geotransform(
    const GeoTransform& full_resolution,
    uint32_t full_width, uint32_t full_height,
    uint32_t level_width, uint32_t level_height) noexcept {

    if (level_width == 0 || level_height == 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat, "Cannot scale geotransform to a level with a zero dimension");
    }
    // Integer ratios: overview sizes are expected to divide the full size
    const double x_scale = static_cast<double>(full_width / level_width);
    const double y_scale = static_cast<double>(full_height / level_height);
    return Ok(GeoTransform{
        full_resolution[0], full_resolution[1] * x_scale, 0.0,
        full_resolution[3], 0.0, full_resolution[5] * y_scale});
}

inline Result<GeoTransform> geotransform_for(const GeoTiffDocument& document, std::size_t level) noexcept {
    if (level >= document.levels.size()) [[unlikely]] {
        return Err(Error::Code::InvalidLevel,
                   "Level " + std::to_string(level) + " not in this file (" +
                   std::to_string(document.levels.size()) + " levels)");
    }
    if (level == 0) {
        return Ok(document.geotransform);
    }
    const RasterLevel& full = document.levels.front();
    const RasterLevel& target = document.levels[level];
    return scale_geotransform(document.geotransform, full.width, full.height, target.width, target.height);
}

template <GeoKeyInterpreter Interpreter>
Result<std::string> resolve_crs(const GeoTiffDocument& document, const Interpreter& interpreter) noexcept {
    if (!document.geo_double_params || !document.geo_ascii_params || document.geo_ascii_params->empty()) {
        return Err(Error::Code::MissingGeoKeys, "Cannot process CRS data: no GeoDoubleParams or GeoAsciiParams");
    }
    return interpreter.crs(document.geokeys, *document.geo_double_params, *document.geo_ascii_params);
}

} // namespace cogreader
