#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include "types.hpp"
#include "types/result.hpp"

namespace cogreader {

/// @brief Half-open pixel rectangle [min_x, max_x) x [min_y, max_y)
struct Rect {
    int64_t min_x = 0;
    int64_t min_y = 0;
    int64_t max_x = 0;
    int64_t max_y = 0;

    [[nodiscard]] static constexpr Rect from_size(int64_t width, int64_t height) noexcept {
        return Rect{0, 0, width, height};
    }

    [[nodiscard]] constexpr int64_t width() const noexcept { return max_x - min_x; }
    [[nodiscard]] constexpr int64_t height() const noexcept { return max_y - min_y; }

    [[nodiscard]] constexpr bool empty() const noexcept {
        return min_x >= max_x || min_y >= max_y;
    }

    /// Largest rectangle contained in both, empty when they do not overlap
    [[nodiscard]] constexpr Rect intersect(const Rect& other) const noexcept {
        Rect r{std::max(min_x, other.min_x), std::max(min_y, other.min_y),
               std::min(max_x, other.max_x), std::min(max_y, other.max_y)};
        if (r.empty()) {
            return Rect{};
        }
        return r;
    }

    [[nodiscard]] constexpr bool contains(int64_t x, int64_t y) const noexcept {
        return x >= min_x && x < max_x && y >= min_y && y < max_y;
    }

    constexpr bool operator==(const Rect&) const noexcept = default;
};

/// Sample types a grayscale level can decode to
enum class SampleType : uint8_t {
    UInt8,
    UInt16,
    Int8,
    Int16
};

/// @brief Name of a sample type: "UInt8", "UInt16", "Int8" or "Int16"
[[nodiscard]] constexpr std::string_view sample_type_name(SampleType type) noexcept {
    switch (type) {
        case SampleType::UInt8:  return "UInt8";
        case SampleType::UInt16: return "UInt16";
        case SampleType::Int8:   return "Int8";
        case SampleType::Int16:  return "Int16";
    }
    return {};
}

/**
 * @brief Sample type of a level from its BitsPerSample and SampleFormat
 *
 * @retval Error::Code::InvalidFormat bits_per_sample is 0 (tag missing)
 * @retval Error::Code::UnsupportedFeature Any depth other than 8 or 16, or a
 *         sample format other than unsigned or signed integer
 */
[[nodiscard]] inline Result<SampleType> sample_type_for(uint16_t bits_per_sample, SampleFormat format) noexcept {
    if (bits_per_sample == 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat, "BitsPerSample tag not found");
    }
    if (bits_per_sample != 8 && bits_per_sample != 16) [[unlikely]] {
        return Err(Error::Code::UnsupportedFeature,
                   "BitsPerSample of " + std::to_string(bits_per_sample) + " not supported");
    }
    switch (format) {
        case SampleFormat::UnsignedInt:
            return Ok(bits_per_sample == 8 ? SampleType::UInt8 : SampleType::UInt16);
        case SampleFormat::SignedInt:
            return Ok(bits_per_sample == 8 ? SampleType::Int8 : SampleType::Int16);
        default:
            return Err(Error::Code::UnsupportedFeature,
                       "SampleFormat " + std::to_string(static_cast<uint16_t>(format)) + " not supported");
    }
}

/// @brief Display range of a grayscale sample type
struct ColorModel {
    SampleType type = SampleType::UInt8;
    int32_t min = 0;
    int32_t max = 255;

    constexpr bool operator==(const ColorModel&) const noexcept = default;
};

[[nodiscard]] constexpr ColorModel color_model_for(SampleType type) noexcept {
    switch (type) {
        case SampleType::UInt8:  return ColorModel{type, 0, 255};
        case SampleType::UInt16: return ColorModel{type, 0, 65535};
        case SampleType::Int8:   return ColorModel{type, -128, 127};
        case SampleType::Int16:  return ColorModel{type, -32768, 32767};
    }
    return ColorModel{};
}

/// Concept for the sample types of GrayImage
template <typename T>
concept GraySample = std::same_as<T, uint8_t> || std::same_as<T, uint16_t> ||
                     std::same_as<T, int8_t> || std::same_as<T, int16_t>;

template <GraySample T>
[[nodiscard]] constexpr SampleType sample_type_of() noexcept {
    if constexpr (std::is_same_v<T, uint8_t>) {
        return SampleType::UInt8;
    } else if constexpr (std::is_same_v<T, uint16_t>) {
        return SampleType::UInt16;
    } else if constexpr (std::is_same_v<T, int8_t>) {
        return SampleType::Int8;
    } else {
        return SampleType::Int16;
    }
}

/**
 * @brief Single band image in absolute pixel coordinates
 *
 * Samples are stored row-major; at(x, y) takes coordinates inside bounds(),
 * so a window decoded at (512, 256) is addressed from (512, 256).
 */
template <GraySample T>
class GrayImage {
private:
    Rect bounds_;
    std::vector<T> pixels_;
    std::optional<double> nodata_;

    [[nodiscard]] std::size_t index(int64_t x, int64_t y) const noexcept {
        return static_cast<std::size_t>(y - bounds_.min_y) * static_cast<std::size_t>(bounds_.width()) +
               static_cast<std::size_t>(x - bounds_.min_x);
    }

public:
    using sample_type = T;

    GrayImage() = default;

    explicit GrayImage(Rect bounds, std::optional<double> nodata = std::nullopt)
        : bounds_(bounds.empty() ? Rect{} : bounds)
        , pixels_(static_cast<std::size_t>(bounds_.width()) * static_cast<std::size_t>(bounds_.height()), T{0})
        , nodata_(nodata) {}

    [[nodiscard]] const Rect& bounds() const noexcept { return bounds_; }
    [[nodiscard]] int64_t width() const noexcept { return bounds_.width(); }
    [[nodiscard]] int64_t height() const noexcept { return bounds_.height(); }

    [[nodiscard]] T at(int64_t x, int64_t y) const noexcept { return pixels_[index(x, y)]; }
    void set(int64_t x, int64_t y, T value) noexcept { pixels_[index(x, y)] = value; }

    /// Samples of row y (absolute)
    [[nodiscard]] std::span<T> row(int64_t y) noexcept {
        return std::span<T>(pixels_).subspan(index(bounds_.min_x, y), static_cast<std::size_t>(bounds_.width()));
    }
    [[nodiscard]] std::span<const T> row(int64_t y) const noexcept {
        return std::span<const T>(pixels_).subspan(index(bounds_.min_x, y), static_cast<std::size_t>(bounds_.width()));
    }

    [[nodiscard]] std::span<const T> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<T> pixels() noexcept { return pixels_; }

    [[nodiscard]] const std::optional<double>& nodata() const noexcept { return nodata_; }

    [[nodiscard]] static constexpr ColorModel color_model() noexcept {
        return color_model_for(sample_type_of<T>());
    }
};

/// Decoded window of a level, typed by its sample type
using PixelBuffer = std::variant<
    GrayImage<uint8_t>,
    GrayImage<uint16_t>,
    GrayImage<int8_t>,
    GrayImage<int16_t>
>;

/// @brief Zero-filled buffer of the given sample type covering bounds
[[nodiscard]] inline PixelBuffer make_pixel_buffer(SampleType type, Rect bounds, std::optional<double> nodata) {
    switch (type) {
        case SampleType::UInt8:  return GrayImage<uint8_t>(bounds, nodata);
        case SampleType::UInt16: return GrayImage<uint16_t>(bounds, nodata);
        case SampleType::Int8:   return GrayImage<int8_t>(bounds, nodata);
        case SampleType::Int16:  return GrayImage<int16_t>(bounds, nodata);
    }
    return GrayImage<uint8_t>(bounds, nodata);
}

/// @brief Bounds of any PixelBuffer alternative
[[nodiscard]] inline Rect bounds_of(const PixelBuffer& buffer) noexcept {
    return std::visit([](const auto& image) { return image.bounds(); }, buffer);
}

/// @brief Sample type of any PixelBuffer alternative
[[nodiscard]] inline SampleType sample_type_of(const PixelBuffer& buffer) noexcept {
    return std::visit([](const auto& image) {
        return sample_type_of<typename std::decay_t<decltype(image)>::sample_type>();
    }, buffer);
}

} // namespace cogreader
