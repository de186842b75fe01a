#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "tag_directory.hpp"
#include "types/result.hpp"

namespace cogreader {

/// GeoKey ids read by EpsgGeoKeyInterpreter
enum class GeoKey : uint16_t {
    GTModelType        = 1024,
    GTRasterType       = 1025,
    GeographicType     = 2048,
    ProjectedCSType    = 3072
};

/// GeoKey value meaning "user-defined" in the GeoTIFF key space
inline constexpr uint16_t kUserDefinedGeoKeyValue = 32767;

/// Concept for the component turning a GeoKey directory into a CRS description
///
/// The keys are given raw: entries whose tag_location is GeoDoubleParams or
/// GeoAsciiParams index into double_params and ascii_params respectively.
template <typename T>
concept GeoKeyInterpreter = requires(const T& interpreter,
                                     std::span<const GeoKeyEntry> keys,
                                     std::span<const double> double_params,
                                     std::string_view ascii_params) {
    { interpreter.crs(keys, double_params, ascii_params) } -> std::same_as<Result<std::string>>;
};

/// @brief Minimal interpreter rendering "EPSG:<code>"
///
/// Uses ProjectedCSTypeGeoKey, then GeographicTypeGeoKey. Files describing their
/// CRS parameter by parameter need a richer interpreter.
class EpsgGeoKeyInterpreter {
public:
    /// @retval Error::Code::MissingGeoKeys Neither key is present
    /// @retval Error::Code::UnsupportedFeature The CRS is user-defined
    [[nodiscard]] Result<std::string> crs(
        std::span<const GeoKeyEntry> keys,
        std::span<const double> double_params,
        std::string_view ascii_params) const noexcept;
};

static_assert(GeoKeyInterpreter<EpsgGeoKeyInterpreter>);

/// @brief Geotransform of a level derived from the full resolution one
///
/// Pixel sizes are multiplied by the integer ratio between the full resolution
/// size and the level size; origin is kept and rotation terms are 0.
///
/// @retval Error::Code::InvalidFormat The level has a zero dimension
[[nodiscard]] Result<GeoTransform> scale_geotransform(
    const GeoTransform& full_resolution,
    uint32_t full_width, uint32_t full_height,
    uint32_t level_width, uint32_t level_height) noexcept;

/// @brief Geotransform of a resolution level of document
/// @retval Error::Code::InvalidLevel level is not an index into document.levels
[[nodiscard]] Result<GeoTransform> geotransform_for(const GeoTiffDocument& document, std::size_t level) noexcept;

/// @brief CRS description of document, as rendered by interpreter
/// @retval Error::Code::MissingGeoKeys The file has no GeoDoubleParams or no GeoAsciiParams
template <GeoKeyInterpreter Interpreter>
[[nodiscard]] Result<std::string> resolve_crs(const GeoTiffDocument& document, const Interpreter& interpreter) noexcept;

} // namespace cogreader

#define COGREADER_GEOREFERENCE_HEADER
#include "impl/georeference_impl.hpp"
