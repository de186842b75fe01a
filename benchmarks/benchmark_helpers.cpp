#include "benchmark_helpers.hpp"

#include <limits>
#include <type_traits>

#include "../tests/test_helpers.hpp"

namespace cog_bench {

std::string ImageConfig::name() const {
    return std::to_string(width) + "x" + std::to_string(height) +
           "_tile" + std::to_string(tile_width) + "x" + std::to_string(tile_height) +
           "_ovr" + std::to_string(overviews);
}

uint16_t compression_code(CompressionType compression) noexcept {
    switch (compression) {
        case CompressionType::None:     return 1;
        case CompressionType::LZW:      return 5;
        case CompressionType::Deflate:  return 8;
        case CompressionType::PackBits: return 32773;
    }
    return 1;
}

template <typename T>
std::vector<T> ImageGenerator<T>::generate_random(uint32_t width, uint32_t height) {
    std::uniform_int_distribution<int> dist(std::numeric_limits<T>::min(), std::numeric_limits<T>::max());
    std::vector<T> data(static_cast<std::size_t>(width) * height);
    for (auto& value : data) {
        value = static_cast<T>(dist(rng_));
    }
    return data;
}

template <typename T>
std::vector<T> ImageGenerator<T>::generate_gradient(uint32_t width, uint32_t height) {
    std::vector<T> data(static_cast<std::size_t>(width) * height);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            data[static_cast<std::size_t>(y) * width + x] = static_cast<T>((x + y) % 256);
        }
    }
    return data;
}

namespace {

/// Keep every other sample in both directions
template <typename T>
std::vector<T> halve(const std::vector<T>& raster, uint32_t width, uint32_t height) {
    const uint32_t half_width = (width + 1) / 2;
    const uint32_t half_height = (height + 1) / 2;
    std::vector<T> out(static_cast<std::size_t>(half_width) * half_height);
    for (uint32_t y = 0; y < half_height; ++y) {
        for (uint32_t x = 0; x < half_width; ++x) {
            out[static_cast<std::size_t>(y) * half_width + x] =
                raster[static_cast<std::size_t>(2 * y) * width + 2 * x];
        }
    }
    return out;
}

} // namespace

template <typename T>
std::vector<std::byte> make_cog(const ImageConfig& image_config,
                                const StorageConfig& storage_config,
                                ImagePattern pattern) {
    ImageGenerator<T> generator;
    std::vector<T> raster = pattern == ImagePattern::Random
        ? generator.generate_random(image_config.width, image_config.height)
        : generator.generate_gradient(image_config.width, image_config.height);

    const uint16_t compression = compression_code(storage_config.compression);
    const bool predictor = storage_config.predictor == PredictorType::Horizontal;

    cogreader_test::CogBuilder builder(storage_config.byte_order);
    uint32_t width = image_config.width;
    uint32_t height = image_config.height;
    for (uint32_t level = 0; level <= image_config.overviews; ++level) {
        builder.add_level(cogreader_test::tiled_level(raster, width, height,
                                                      image_config.tile_width, image_config.tile_height,
                                                      storage_config.byte_order, compression, predictor));
        if (level < image_config.overviews) {
            raster = halve(raster, width, height);
            width = (width + 1) / 2;
            height = (height + 1) / 2;
        }
    }
    builder.set_geo(cogreader_test::web_mercator_geo(10.0));
    return builder.build();
}

// Explicit instantiations
template class ImageGenerator<uint8_t>;
template class ImageGenerator<uint16_t>;
template class ImageGenerator<int16_t>;

template std::vector<std::byte> make_cog<uint8_t>(const ImageConfig&, const StorageConfig&, ImagePattern);
template std::vector<std::byte> make_cog<uint16_t>(const ImageConfig&, const StorageConfig&, ImagePattern);
template std::vector<std::byte> make_cog<int16_t>(const ImageConfig&, const StorageConfig&, ImagePattern);

} // namespace cog_bench
