#include <benchmark/benchmark.h>
#include <memory>
#include <vector>

#include "benchmark_helpers.hpp"

#include "../cogreader/include/cogreader/cog_reader.hpp"
#include "../cogreader/include/cogreader/decompressors.hpp"
#include "../cogreader/include/cogreader/range_cache.hpp"
#include "../cogreader/include/cogreader/readers/memory_fetcher.hpp"
#include "../cogreader/include/cogreader/readers/reader_buffer.hpp"
#include "../cogreader/include/cogreader/tag_directory.hpp"
#include "../cogreader/include/cogreader/tile_decoder.hpp"

using namespace cogreader;
using namespace cog_bench;

namespace {

cog_bench::ImageConfig image_config_for(int64_t index) {
    switch (index) {
        case 0: return configs::small_cog;
        case 1: return configs::medium_cog;
        default: return configs::large_cog;
    }
}

StorageConfig storage_config_for(int64_t index) {
    switch (index) {
        case 0: return configs::raw;
        case 1: return configs::lzw;
        case 2: return configs::deflate;
        case 3: return configs::deflate_big_endian;
        default: return configs::packbits;
    }
}

} // namespace

// ============================================================================
// Metadata Benchmarks
// ============================================================================

static void BM_Metadata_ParseDocument(benchmark::State& state) {
    // Parameters: image config, storage config
    auto file = make_cog<uint16_t>(image_config_for(state.range(0)), storage_config_for(state.range(1)));
    BufferViewReader reader{std::span<const std::byte>(file)};

    for (auto _ : state) {
        auto document = parsing::parse_document(reader);
        if (!document) {
            state.SkipWithError(("Failed to parse document: " + document.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(document.value().levels.data());
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_Metadata_GeoInfo(benchmark::State& state) {
    auto file = make_cog<uint16_t>(image_config_for(state.range(0)), configs::deflate);
    BufferViewReader reader{std::span<const std::byte>(file)};

    for (auto _ : state) {
        auto info = decode_geo_info(reader);
        if (!info) {
            state.SkipWithError(("Failed to build geo info: " + info.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(info.value().geo_transform);
    }
    state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Read Benchmarks - Full Image
// ============================================================================

template <typename T>
static void BM_Read_FullImage(benchmark::State& state) {
    // Parameters: image config, storage config
    const cog_bench::ImageConfig config = image_config_for(state.range(0));
    auto file = make_cog<T>(config, storage_config_for(state.range(1)));
    BufferViewReader reader{std::span<const std::byte>(file)};

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        auto image = decode(reader);
        if (!image) {
            state.SkipWithError(("Failed to decode: " + image.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(std::get<GrayImage<T>>(image.value()).pixels().data());
        bytes_processed += config.num_pixels() * sizeof(T);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
    state.SetLabel(config.name());
}

// ============================================================================
// Read Benchmarks - Partial Regions
// ============================================================================

template <typename T>
static void BM_Read_PartialRegion(benchmark::State& state) {
    // Parameters: region width, storage config
    const cog_bench::ImageConfig config = configs::medium_cog;
    const auto region_width = static_cast<int64_t>(state.range(0));
    auto file = make_cog<T>(config, storage_config_for(state.range(1)));
    BufferViewReader reader{std::span<const std::byte>(file)};

    // Center of the image
    const int64_t offset = (static_cast<int64_t>(config.width) - region_width) / 2;
    const Rect window{offset, offset, offset + region_width, offset + region_width};

    auto document = read_document(reader);
    if (!document) {
        state.SkipWithError(("Failed to parse document: " + document.error().message).c_str());
        return;
    }
    TileDecoder<> decoder; // Constructed once so decoder buffers are reused

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        auto image = decoder.decode(reader, document.value().levels[0], document.value().byte_order, window);
        if (!image) {
            state.SkipWithError(("Failed to decode window: " + image.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(std::get<GrayImage<T>>(image.value()).pixels().data());
        bytes_processed += static_cast<std::size_t>(region_width * region_width) * sizeof(T);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
}

// ============================================================================
// Read Benchmarks - Range Cache
// ============================================================================

static void BM_RangeCache_ColdWindow(benchmark::State& state) {
    // Parameters: chunk size
    const std::size_t chunk_size = static_cast<std::size_t>(state.range(0));
    auto file = make_cog<uint16_t>(configs::medium_cog, configs::deflate);
    MemoryRangeFetcher fetcher(file);
    auto log = fetcher.log();

    std::size_t fetches = 0;
    for (auto _ : state) {
        state.PauseTiming();
        log->clear();
        auto cache = std::make_unique<RangeCache<MemoryRangeFetcher>>(fetcher, chunk_size);
        state.ResumeTiming();

        auto image = decode_level_sub_image(*cache, 0, Rect{300, 300, 556, 556});
        if (!image) {
            state.SkipWithError(("Failed to decode window: " + image.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(image.value());
        fetches += log->range_count();
    }
    state.counters["fetches"] = benchmark::Counter(static_cast<double>(fetches), benchmark::Counter::kAvgIterations);
}

static void BM_RangeCache_WarmWindow(benchmark::State& state) {
    auto file = make_cog<uint16_t>(configs::medium_cog, configs::deflate);
    RangeCache cache(MemoryRangeFetcher(file), static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto image = decode_level_sub_image(cache, 0, Rect{300, 300, 556, 556});
        if (!image) {
            state.SkipWithError(("Failed to decode window: " + image.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(image.value());
    }
    state.counters["chunks"] = static_cast<double>(cache.cached_chunk_count());
}

// ============================================================================
// Decompression Benchmarks
// ============================================================================

static void BM_Decompress_Tile(benchmark::State& state) {
    // Parameters: storage config
    const StorageConfig storage = storage_config_for(state.range(0));
    const cog_bench::ImageConfig config{256, 256, 256, 256, 0};
    auto file = make_cog<uint16_t>(config, storage, ImagePattern::Gradient);
    BufferViewReader reader{std::span<const std::byte>(file)};

    auto document = read_document(reader);
    if (!document) {
        state.SkipWithError(("Failed to parse document: " + document.error().message).c_str());
        return;
    }
    const auto& level = document.value().levels[0];
    std::vector<std::byte> compressed(level.tile_byte_counts[0]);
    if (auto r = reader.read_into(compressed.data(), level.tile_offsets[0], compressed.size()); !r) {
        state.SkipWithError(("Failed to read tile: " + r.error().message).c_str());
        return;
    }

    DecompressorStorage<StandardDecompressors> decompressors;
    std::vector<std::byte> output(config.num_pixels() * sizeof(uint16_t));
    for (auto _ : state) {
        auto produced = decompressors.decompress(output, compressed, level.compression);
        if (!produced) {
            state.SkipWithError(("Failed to decompress: " + produced.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(output.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * output.size()));
}

// ============================================================================
// Benchmark Registration
// ============================================================================

BENCHMARK(BM_Metadata_ParseDocument)
    ->Args({0, 0})     // 256x256, raw
    ->Args({1, 2})     // 1024x1024, deflate
    ->Args({1, 3})     // 1024x1024, deflate, big endian
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Metadata_GeoInfo)
    ->Arg(0)
    ->Arg(1)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_TEMPLATE(BM_Read_FullImage, uint8_t)
    ->Args({1, 0})     // raw
    ->Args({1, 1})     // LZW + predictor
    ->Args({1, 2})     // deflate + predictor
    ->Args({1, 4})     // PackBits
    ->Unit(benchmark::kMillisecond);

BENCHMARK_TEMPLATE(BM_Read_FullImage, uint16_t)
    ->Args({1, 0})
    ->Args({1, 2})
    ->Args({1, 3})
    ->Args({2, 2})     // 4096x4096, deflate
    ->Unit(benchmark::kMillisecond);

BENCHMARK_TEMPLATE(BM_Read_PartialRegion, uint16_t)
    ->Args({64, 2})    // Inside one tile
    ->Args({256, 2})   // Across four tiles
    ->Args({512, 2})
    ->Args({256, 1})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_TEMPLATE(BM_Read_PartialRegion, int16_t)
    ->Args({256, 0})
    ->Args({256, 2})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_RangeCache_ColdWindow)
    ->Arg(4000)
    ->Arg(16384)
    ->Arg(65536)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_RangeCache_WarmWindow)
    ->Arg(4000)
    ->Arg(65536)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Decompress_Tile)
    ->Arg(0)
    ->Arg(1)
    ->Arg(2)
    ->Arg(4)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
