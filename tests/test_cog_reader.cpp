#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../cogreader/include/cogreader/cogreader.hpp"
#include "test_helpers.hpp"

using namespace cogreader;
using namespace cogreader_test;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

/// RawReader over a buffer recording every read_into() call
class CountingReader {
private:
    BufferReader inner_;
    std::shared_ptr<std::vector<std::pair<std::size_t, std::size_t>>> reads_;

public:
    using ReadViewType = BufferReader::ReadViewType;
    static constexpr bool read_must_allocate = false;

    explicit CountingReader(std::vector<std::byte> data)
        : inner_(std::move(data))
        , reads_(std::make_shared<std::vector<std::pair<std::size_t, std::size_t>>>()) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        return inner_.read(offset, size);
    }

    [[nodiscard]] Result<void> read_into(void* buffer, std::size_t offset, std::size_t size) const noexcept {
        reads_->emplace_back(offset, size);
        return inner_.read_into(buffer, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept { return inner_.size(); }
    [[nodiscard]] bool is_valid() const noexcept { return true; }

    [[nodiscard]] const std::vector<std::pair<std::size_t, std::size_t>>& reads() const noexcept { return *reads_; }
};

static_assert(RawReader<CountingReader>);

template <typename T>
void expect_window(const PixelBuffer& buffer, const std::vector<T>& raster, uint32_t raster_width,
                   const Rect& expected_bounds) {
    ASSERT_TRUE(std::holds_alternative<GrayImage<T>>(buffer))
        << "sample type " << sample_type_name(sample_type_of(buffer));
    const auto& image = std::get<GrayImage<T>>(buffer);
    ASSERT_EQ(image.bounds(), expected_bounds);
    for (int64_t y = expected_bounds.min_y; y < expected_bounds.max_y; ++y) {
        for (int64_t x = expected_bounds.min_x; x < expected_bounds.max_x; ++x) {
            const T expected = raster[static_cast<std::size_t>(y) * raster_width + static_cast<std::size_t>(x)];
            if (image.at(x, y) != expected) {
                FAIL() << "pixel (" << x << ", " << y << "): got " << +image.at(x, y) << ", expected " << +expected;
            }
        }
    }
}

template <typename T>
void check_full_decode(ByteOrder order, uint16_t compression, bool horizontal_predictor) {
    constexpr uint32_t width = 200;
    constexpr uint32_t height = 150;
    auto raster = random_samples<T>(static_cast<std::size_t>(width) * height, compression * 7 + horizontal_predictor);

    CogBuilder builder(order);
    builder.add_level(tiled_level(raster, width, height, 64, 64, order, compression, horizontal_predictor));
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    expect_window(image.value(), raster, width, Rect::from_size(width, height));
}

struct SampleFile {
    std::vector<uint16_t> full;
    std::vector<uint16_t> overview;
    std::vector<std::byte> bytes;
};

/// 128x128 UInt16 raster with a 64x64 and a 32x32 overview, deflate and predictor
SampleFile make_sample_file(ByteOrder order, GeoSpec geo = web_mercator_geo(10.0)) {
    SampleFile file;
    file.full = random_samples<uint16_t>(128 * 128, 1);
    file.overview = random_samples<uint16_t>(64 * 64, 2);
    auto smallest = random_samples<uint16_t>(32 * 32, 3);

    CogBuilder builder(order);
    builder.add_level(tiled_level(file.full, 128, 128, 64, 64, order, 8, true))
           .add_level(tiled_level(file.overview, 64, 64, 64, 64, order, 8, true))
           .add_level(tiled_level(smallest, 32, 32, 32, 32, order, 8, true))
           .set_geo(std::move(geo));
    file.bytes = builder.build();
    return file;
}

} // namespace

// ============================================================================
// Full Image Decoding
// ============================================================================

TEST(DecodeTest, UncompressedUInt8) {
    for (ByteOrder order : {ByteOrder::LittleEndian, ByteOrder::BigEndian}) {
        check_full_decode<uint8_t>(order, 1, false);
    }
}

TEST(DecodeTest, SingleTileBytesAreThePixels) {
    // One 256x256 tile, no compression: the decoded buffer is the tile payload
    const auto tile = random_samples<uint8_t>(256 * 256, 7);
    LevelSpec level;
    level.width = level.height = 256;
    level.tile_width = level.tile_height = 256;
    level.tiles.push_back(std::vector<std::byte>(reinterpret_cast<const std::byte*>(tile.data()),
                                                 reinterpret_cast<const std::byte*>(tile.data()) + tile.size()));
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    const auto& gray = image_of<uint8_t>(image.value());
    ASSERT_EQ(gray.bounds(), Rect::from_size(256, 256));
    ASSERT_EQ(gray.pixels().size(), tile.size());
    EXPECT_TRUE(std::equal(gray.pixels().begin(), gray.pixels().end(), tile.begin()));
}

TEST(DecodeTest, SingleTileHorizontalDifferencing) {
    const auto reference = random_samples<uint8_t>(256 * 256, 11);

    // Each sample stored as the difference to its left neighbour, modulo 256
    std::vector<std::byte> payload(reference.size());
    for (std::size_t y = 0; y < 256; ++y) {
        for (std::size_t x = 0; x < 256; ++x) {
            const std::size_t i = y * 256 + x;
            const uint8_t left = x == 0 ? 0 : reference[i - 1];
            payload[i] = static_cast<std::byte>(static_cast<uint8_t>(reference[i] - left));
        }
    }
    LevelSpec level;
    level.width = level.height = 256;
    level.tile_width = level.tile_height = 256;
    level.predictor = 2;
    level.tiles.push_back(std::move(payload));
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    const auto& gray = image_of<uint8_t>(image.value());
    ASSERT_EQ(gray.pixels().size(), reference.size());
    EXPECT_TRUE(std::equal(gray.pixels().begin(), gray.pixels().end(), reference.begin()));
}

TEST(DecodeTest, EveryCompressionWithAndWithoutPredictor) {
    for (ByteOrder order : {ByteOrder::LittleEndian, ByteOrder::BigEndian}) {
        for (uint16_t compression : {1, 5, 8, 32946, 32773}) {
            for (bool predictor : {false, true}) {
                SCOPED_TRACE(testing::Message() << "compression " << compression << ", predictor " << predictor
                             << ", " << (order == ByteOrder::LittleEndian ? "II" : "MM"));
                check_full_decode<uint8_t>(order, compression, predictor);
                check_full_decode<uint16_t>(order, compression, predictor);
            }
        }
    }
}

TEST(DecodeTest, SignedSamples) {
    for (ByteOrder order : {ByteOrder::LittleEndian, ByteOrder::BigEndian}) {
        check_full_decode<int8_t>(order, 5, true);
        check_full_decode<int16_t>(order, 8, true);
        check_full_decode<int16_t>(order, 1, false);
    }
}

TEST(DecodeTest, UnspecifiedCompressionMeansNone) {
    check_full_decode<uint8_t>(ByteOrder::LittleEndian, 0, false);
}

TEST(DecodeTest, NonSquareTiles) {
    constexpr uint32_t width = 100;
    constexpr uint32_t height = 70;
    auto raster = gradient_samples<uint16_t>(width, height);

    CogBuilder builder;
    builder.add_level(tiled_level(raster, width, height, 32, 16, ByteOrder::LittleEndian, 5, true));
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    expect_window(image.value(), raster, width, Rect::from_size(width, height));

    // Rows below the first tile row
    auto window = decode_level_sub_image(reader, 0, Rect{40, 30, 90, 69});
    ASSERT_TRUE(window.is_ok()) << window.error().message;
    expect_window(window.value(), raster, width, Rect{40, 30, 90, 69});
}

TEST(DecodeTest, OverviewLevel) {
    auto file = make_sample_file(ByteOrder::BigEndian);
    BufferReader reader(file.bytes);

    auto overview = decode_level(reader, 1);
    ASSERT_TRUE(overview.is_ok()) << overview.error().message;
    expect_window(overview.value(), file.overview, 64, Rect::from_size(64, 64));
}

TEST(DecodeTest, NodataCarriedIntoImage) {
    GeoSpec geo = web_mercator_geo();
    geo.nodata = "65535";
    auto file = make_sample_file(ByteOrder::LittleEndian, geo);
    BufferReader reader(file.bytes);

    auto image = decode(reader);
    ASSERT_TRUE(image.is_ok());
    const auto& gray = image_of<uint16_t>(image.value());
    ASSERT_TRUE(gray.nodata().has_value());
    EXPECT_DOUBLE_EQ(*gray.nodata(), 65535.0);
}

TEST(DecodeTest, UnparsableNodataBecomesZero) {
    GeoSpec geo = web_mercator_geo();
    geo.nodata = "n/a";
    auto file = make_sample_file(ByteOrder::LittleEndian, geo);
    BufferReader reader(file.bytes);

    auto image = decode(reader);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    const auto& gray = image_of<uint16_t>(image.value());
    ASSERT_TRUE(gray.nodata().has_value());
    EXPECT_DOUBLE_EQ(*gray.nodata(), 0.0);
}

// ============================================================================
// Error Reporting
// ============================================================================

TEST(ErrorTest, DescribePrefixesTheKind) {
    const std::pair<Error::Code, std::string> cases[] = {
        {Error::Code::InvalidHeader, "invalid format: "},
        {Error::Code::CompressionError, "invalid format: "},
        {Error::Code::UnsupportedFeature, "unsupported feature: "},
        {Error::Code::UnexpectedEndOfFile, "transport error: "},
        {Error::Code::InsufficientData, "insufficient data: "},
        {Error::Code::InvalidLevel, "invalid request: "},
    };
    for (const auto& [code, prefix] : cases) {
        Error error{code, "details"};
        EXPECT_EQ(error.describe(), prefix + "details");
    }
}

TEST(ErrorTest, DescribeUnsupportedCompression) {
    auto raster = gradient_samples<uint8_t>(16, 16);
    auto level = tiled_level(raster, 16, 16, 16, 16, ByteOrder::LittleEndian);
    level.compression = 99;
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_FALSE(image.is_ok());
    const std::string text = image.error().describe();
    EXPECT_EQ(text.rfind("unsupported feature: ", 0), 0u) << text;
    EXPECT_NE(text.find("99"), std::string::npos) << text;
}

// ============================================================================
// Windows
// ============================================================================

TEST(SubImageTest, ReadsOnlyOverlappingTiles) {
    constexpr uint32_t size = 256;
    auto raster = random_samples<uint8_t>(size * size);
    CogBuilder builder;
    builder.add_level(tiled_level(raster, size, size, 64, 64, ByteOrder::LittleEndian, 8));
    CountingReader reader(builder.build());

    auto document = read_document(reader);
    ASSERT_TRUE(document.is_ok());
    const auto& offsets = document.value().levels[0].tile_offsets;
    const std::set<std::size_t> tile_starts(offsets.begin(), offsets.end());

    const std::size_t reads_before = reader.reads().size();
    auto window = decode_level_sub_image(reader, 0, Rect{60, 60, 70, 70});
    ASSERT_TRUE(window.is_ok()) << window.error().message;
    expect_window(window.value(), raster, size, Rect{60, 60, 70, 70});

    std::set<std::size_t> tiles_read;
    for (std::size_t i = reads_before; i < reader.reads().size(); ++i) {
        if (tile_starts.count(reader.reads()[i].first) != 0) {
            tiles_read.insert(reader.reads()[i].first);
        }
    }
    // Tiles (0,0), (1,0), (0,1) and (1,1)
    const std::set<std::size_t> expected{offsets[0], offsets[1], offsets[4], offsets[5]};
    EXPECT_EQ(tiles_read, expected);
}

TEST(SubImageTest, WindowClippedToImage) {
    constexpr uint32_t width = 90;
    constexpr uint32_t height = 60;
    auto raster = random_samples<int16_t>(width * height);
    CogBuilder builder(ByteOrder::BigEndian);
    builder.add_level(tiled_level(raster, width, height, 32, 32, ByteOrder::BigEndian, 32773));
    BufferReader reader(builder.build());

    auto window = decode_level_sub_image(reader, 0, Rect{-20, 50, 40, 1000});
    ASSERT_TRUE(window.is_ok()) << window.error().message;
    expect_window(window.value(), raster, width, Rect{0, 50, 40, 60});
}

TEST(SubImageTest, WindowOutsideImage) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    BufferReader reader(file.bytes);

    auto window = decode_level_sub_image(reader, 0, Rect{128, 0, 200, 50});
    ASSERT_TRUE(window.is_error());
    EXPECT_EQ(window.error().code, Error::Code::OutOfBounds);
    EXPECT_EQ(window.error().kind(), ErrorKind::Usage);
}

TEST(SubImageTest, InvalidLevel) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    BufferReader reader(file.bytes);

    auto window = decode_level_sub_image(reader, 3, Rect{0, 0, 10, 10});
    ASSERT_TRUE(window.is_error());
    EXPECT_EQ(window.error().code, Error::Code::InvalidLevel);
}

TEST(SubImageTest, ThroughRangeCache) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    MemoryRangeFetcher fetcher(file.bytes);
    auto log = fetcher.log();
    RangeCache cache(fetcher, 1024);

    auto first = decode_level_sub_image(cache, 0, Rect{10, 70, 100, 120});
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    expect_window(first.value(), file.full, 128, Rect{10, 70, 100, 120});

    // Directory and tiles are all cached now
    const std::size_t fetches = log->range_count();
    auto second = decode_level_sub_image(cache, 0, Rect{10, 70, 100, 120});
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(log->range_count(), fetches);
    EXPECT_EQ(log->probe_count(), 0u);
}

// ============================================================================
// Tile Data Errors
// ============================================================================

TEST(TileErrorTest, ShortTileIsInsufficientData) {
    constexpr uint32_t size = 64;
    auto raster = random_samples<uint8_t>(size * size);
    auto level = tiled_level(raster, size, size, 64, 64, ByteOrder::LittleEndian);
    level.byte_counts = std::vector<uint32_t>{100};
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::InsufficientData);
    EXPECT_EQ(image.error().kind(), ErrorKind::InsufficientData);

    // The first row of the tile is complete
    auto first_row = decode_level_sub_image(reader, 0, Rect{0, 0, 64, 1});
    ASSERT_TRUE(first_row.is_ok()) << first_row.error().message;
    expect_window(first_row.value(), raster, size, Rect{0, 0, 64, 1});
}

TEST(TileErrorTest, EmptyTileIsInsufficientData) {
    auto raster = random_samples<uint8_t>(64 * 64);
    auto level = tiled_level(raster, 64, 64, 32, 32, ByteOrder::LittleEndian);
    level.byte_counts = std::vector<uint32_t>{1024, 0, 1024, 1024};
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::InsufficientData);

    // Tiles other than the sparse one still decode
    auto left = decode_level_sub_image(reader, 0, Rect{0, 0, 32, 64});
    ASSERT_TRUE(left.is_ok()) << left.error().message;
}

TEST(TileErrorTest, TruncatedFile) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    file.bytes.resize(file.bytes.size() - 10);
    BufferReader reader(file.bytes);

    // The last tile of the file belongs to the smallest overview
    auto image = decode_level(reader, 2);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().kind(), ErrorKind::Transport);
}

TEST(TileErrorTest, CorruptCompressedTile) {
    auto raster = random_samples<uint8_t>(32 * 32);
    auto level = tiled_level(raster, 32, 32, 32, 32, ByteOrder::LittleEndian, 8);
    std::fill(level.tiles[0].begin(), level.tiles[0].end(), std::byte{0x12});
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::CompressionError);
}

TEST(TileErrorTest, UnknownCompression) {
    auto raster = random_samples<uint8_t>(32 * 32);
    auto level = tiled_level(raster, 32, 32, 32, 32, ByteOrder::LittleEndian, 99);
    CogBuilder builder;
    builder.add_level(level);
    CountingReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::UnsupportedFeature);
    EXPECT_NE(image.error().message.find("99"), std::string::npos);
}

TEST(TileErrorTest, InconsistentTileCounts) {
    auto raster = random_samples<uint8_t>(64 * 64);
    auto level = tiled_level(raster, 64, 64, 32, 32, ByteOrder::LittleEndian);
    level.byte_counts = std::vector<uint32_t>{1024, 1024};
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::InvalidFormat);
}

TEST(TileErrorTest, StripLayoutUnsupported) {
    auto raster = random_samples<uint8_t>(32 * 32);
    auto level = tiled_level(raster, 32, 32, 32, 32, ByteOrder::LittleEndian);
    level.omitted_tags = {322, 323, 324, 325};
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::UnsupportedFeature);
}

TEST(TileErrorTest, MultiBandUnsupported) {
    auto raster = random_samples<uint8_t>(32 * 32);
    auto level = tiled_level(raster, 32, 32, 32, 32, ByteOrder::LittleEndian);
    level.samples_per_pixel = 3;
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::UnsupportedFeature);
}

TEST(TileErrorTest, PaletteUnsupported) {
    auto raster = random_samples<uint8_t>(32 * 32);
    auto level = tiled_level(raster, 32, 32, 32, 32, ByteOrder::LittleEndian);
    level.photometric = 3;
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto image = decode(reader);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::UnsupportedFeature);
}

TEST(TileErrorTest, TileIndexOutsideGrid) {
    auto raster = random_samples<uint8_t>(64 * 64);
    CogBuilder builder;
    builder.add_level(tiled_level(raster, 64, 64, 32, 32, ByteOrder::LittleEndian));
    BufferReader reader(builder.build());

    auto document = read_document(reader);
    ASSERT_TRUE(document.is_ok());
    TileDecoder<> decoder;

    auto last = decoder.decode_tile(reader, document.value().levels[0], ByteOrder::LittleEndian, 3);
    ASSERT_TRUE(last.is_ok()) << last.error().message;
    EXPECT_EQ(last.value().size(), 32u * 32u);

    auto outside = decoder.decode_tile(reader, document.value().levels[0], ByteOrder::LittleEndian, 4);
    ASSERT_TRUE(outside.is_error());
    EXPECT_EQ(outside.error().code, Error::Code::OutOfBounds);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(DecodeConfigTest, SizeAndColorModel) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    BufferReader reader(file.bytes);

    auto config = decode_config(reader);
    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().width, 128u);
    EXPECT_EQ(config.value().height, 128u);
    ASSERT_TRUE(config.value().color_model.has_value());
    EXPECT_EQ(*config.value().color_model, (ColorModel{SampleType::UInt16, 0, 65535}));

    auto overview = decode_config_level(reader, 2);
    ASSERT_TRUE(overview.is_ok());
    EXPECT_EQ(overview.value().width, 32u);
    EXPECT_EQ(overview.value().height, 32u);
}

TEST(DecodeConfigTest, InvalidLevel) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    BufferReader reader(file.bytes);

    auto config = decode_config_level(reader, 3);
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, Error::Code::InvalidLevel);
}

TEST(DecodeConfigTest, NoColorModelForNonGrayscale) {
    auto raster = random_samples<uint8_t>(32 * 32);
    auto level = tiled_level(raster, 32, 32, 32, 32, ByteOrder::LittleEndian);
    level.photometric = 2;
    CogBuilder builder;
    builder.add_level(level);
    BufferReader reader(builder.build());

    auto config = decode_config(reader);
    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_FALSE(config.value().color_model.has_value());
    EXPECT_EQ(config.value().width, 32u);
}

// ============================================================================
// Georeferencing Summary
// ============================================================================

TEST(GeoInfoTest, Summary) {
    for (ByteOrder order : {ByteOrder::LittleEndian, ByteOrder::BigEndian}) {
        GeoSpec geo = web_mercator_geo(10.0);
        geo.nodata = "-9999";
        auto file = make_sample_file(order, geo);
        BufferReader reader(file.bytes);

        auto info = decode_geo_info(reader);
        ASSERT_TRUE(info.is_ok()) << info.error().message;
        EXPECT_EQ(info.value().data_type, "UInt16");
        EXPECT_EQ(info.value().size, (std::array<uint32_t, 2>{128, 128}));
        EXPECT_EQ(info.value().crs, "EPSG:3857");
        EXPECT_DOUBLE_EQ(info.value().nodata, -9999.0);
        EXPECT_EQ(info.value().geo_transform,
                  (GeoTransform{500000.0, 10.0, 0.0, 4000000.0, 0.0, -10.0}));

        ASSERT_EQ(info.value().overviews.size(), 3u);
        EXPECT_EQ(info.value().overviews[0].size, (std::array<uint32_t, 2>{128, 128}));
        EXPECT_EQ(info.value().overviews[1].size, (std::array<uint32_t, 2>{64, 64}));
        EXPECT_EQ(info.value().overviews[2].size, (std::array<uint32_t, 2>{32, 32}));
    }
}

TEST(GeoInfoTest, OverviewGeotransform) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    BufferReader reader(file.bytes);
    auto info = decode_geo_info(reader);
    ASSERT_TRUE(info.is_ok()) << info.error().message;

    auto full = info.value().geotransform(0);
    ASSERT_TRUE(full.is_ok());
    EXPECT_EQ(full.value(), info.value().geo_transform);

    auto quarter = info.value().geotransform(2);
    ASSERT_TRUE(quarter.is_ok());
    EXPECT_DOUBLE_EQ(quarter.value()[1], 40.0);
    EXPECT_DOUBLE_EQ(quarter.value()[5], -40.0);
    EXPECT_DOUBLE_EQ(quarter.value()[0], 500000.0);

    auto missing = info.value().geotransform(3);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, Error::Code::InvalidLevel);
}

TEST(GeoInfoTest, NodataDefaultsToZero) {
    auto file = make_sample_file(ByteOrder::LittleEndian);
    BufferReader reader(file.bytes);

    auto info = decode_geo_info(reader);
    ASSERT_TRUE(info.is_ok());
    EXPECT_DOUBLE_EQ(info.value().nodata, 0.0);
}

TEST(GeoInfoTest, MissingCrsParameters) {
    GeoSpec geo = web_mercator_geo();
    geo.double_params.reset();
    auto file = make_sample_file(ByteOrder::LittleEndian, geo);
    BufferReader reader(file.bytes);

    auto info = decode_geo_info(reader);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, Error::Code::MissingGeoKeys);
}

TEST(GeoInfoTest, FloatingPointSamplesUnsupported) {
    auto raster = random_samples<uint8_t>(32 * 32);
    auto level = tiled_level(raster, 32, 32, 32, 32, ByteOrder::LittleEndian);
    level.bits_per_sample = 32;
    level.sample_format = 3;
    CogBuilder builder;
    builder.add_level(level).set_geo(web_mercator_geo());
    BufferReader reader(builder.build());

    auto info = decode_geo_info(reader);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, Error::Code::UnsupportedFeature);
}

TEST(GeoInfoTest, ThroughRangeCache) {
    auto file = make_sample_file(ByteOrder::BigEndian);
    RangeCache cache(MemoryRangeFetcher(file.bytes, "memory://sample.tif"), 512);

    auto info = decode_geo_info(cache);
    ASSERT_TRUE(info.is_ok()) << info.error().message;
    EXPECT_EQ(info.value().crs, "EPSG:3857");
    // Only the directories were needed, not the tiles
    EXPECT_LT(cache.cached_chunk_count() * cache.chunk_size(), file.bytes.size());
}
