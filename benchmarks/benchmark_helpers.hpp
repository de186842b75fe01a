#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "../cogreader/include/cogreader/types.hpp"

namespace cog_bench {

/// Tile compression of generated files
enum class CompressionType { None, LZW, Deflate, PackBits };

/// Predictor type enumeration
enum class PredictorType { None, Horizontal };

/// Test image configuration
struct ImageConfig {
    uint32_t width;
    uint32_t height;
    uint32_t tile_width;
    uint32_t tile_height;
    uint32_t overviews = 0;     ///< Number of halved levels after the full resolution one

    std::string name() const;
    std::size_t num_pixels() const {
        return static_cast<std::size_t>(width) * height;
    }
};

/// Test file storage
struct StorageConfig {
    CompressionType compression = CompressionType::None;
    PredictorType predictor = PredictorType::None;
    cogreader::ByteOrder byte_order = cogreader::ByteOrder::LittleEndian;
};

/// Predefined configurations
namespace configs {
    constexpr ImageConfig small_cog{256, 256, 64, 64, 2};
    constexpr ImageConfig medium_cog{1024, 1024, 256, 256, 3};
    constexpr ImageConfig large_cog{4096, 4096, 512, 512, 4};

    constexpr StorageConfig raw{CompressionType::None, PredictorType::None, cogreader::ByteOrder::LittleEndian};
    constexpr StorageConfig lzw{CompressionType::LZW, PredictorType::Horizontal, cogreader::ByteOrder::LittleEndian};
    constexpr StorageConfig deflate{CompressionType::Deflate, PredictorType::Horizontal, cogreader::ByteOrder::LittleEndian};
    constexpr StorageConfig deflate_big_endian{CompressionType::Deflate, PredictorType::Horizontal, cogreader::ByteOrder::BigEndian};
    constexpr StorageConfig packbits{CompressionType::PackBits, PredictorType::None, cogreader::ByteOrder::LittleEndian};
}

enum ImagePattern {
    Gradient,
    Random
};

/// TIFF Compression tag value
uint16_t compression_code(CompressionType compression) noexcept;

/// Image data generator
template <typename T>
class ImageGenerator {
public:
    explicit ImageGenerator(uint64_t seed = 42) : rng_(seed) {}

    /// Generate random image data
    std::vector<T> generate_random(uint32_t width, uint32_t height);

    /// Generate gradient pattern (compressible)
    std::vector<T> generate_gradient(uint32_t width, uint32_t height);

private:
    std::mt19937_64 rng_;
};

/**
 * @brief Build a complete COG in memory
 *
 * Level i is the full resolution raster subsampled by 2^i, tiled with the
 * configured tile size. Level 0 carries Web Mercator georeferencing.
 */
template <typename T>
std::vector<std::byte> make_cog(const ImageConfig& image_config,
                                const StorageConfig& storage_config,
                                ImagePattern pattern = ImagePattern::Gradient);

/// Helper to compute image throughput in MB/s
inline double compute_throughput(std::size_t bytes, double time_ns) {
    if (time_ns <= 0.0) return 0.0;
    double seconds = time_ns / 1e9;
    double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
    return mb / seconds;
}

} // namespace cog_bench
