#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cstring>
#include <random>
#include <span>
#include <utility>
#include <vector>

#include "../cogreader/include/cogreader/decompressors.hpp"
#include "test_helpers.hpp"

using namespace cogreader;
using namespace cogreader_test;

// ============================================================================
// Helper Functions
// ============================================================================

/// Generate random byte data
std::vector<std::byte> generate_random_bytes(std::size_t count, uint64_t seed = 42) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::byte> data(count);
    for (auto& byte : data) {
        byte = static_cast<std::byte>(dist(rng));
    }
    return data;
}

/// Generate data with runs (good for PackBits)
std::vector<std::byte> generate_data_with_runs(std::size_t count, uint64_t seed = 42) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> value_dist(0, 255);
    std::uniform_int_distribution<std::size_t> run_dist(1, 200);

    std::vector<std::byte> data;
    data.reserve(count);
    while (data.size() < count) {
        std::size_t run_length = std::min(run_dist(rng), count - data.size());
        std::byte value = static_cast<std::byte>(value_dist(rng));
        data.insert(data.end(), run_length, value);
    }
    return data;
}

std::vector<std::byte> bytes_of(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    for (int v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

template <typename Decompressor>
std::vector<std::byte> decompress_all(const Decompressor& decompressor,
                                      std::span<const std::byte> input,
                                      std::size_t expected_size) {
    std::vector<std::byte> output(expected_size);
    auto result = decompressor.decompress(output, input);
    EXPECT_TRUE(result.is_ok()) << (result.is_error() ? result.error().message : "");
    if (result.is_error()) {
        return {};
    }
    output.resize(result.value());
    return output;
}

// ============================================================================
// None
// ============================================================================

TEST(NoneDecompressor, CopiesInput) {
    NoneDecompressor decompressor;
    auto input = generate_random_bytes(1000);
    EXPECT_EQ(decompress_all(decompressor, input, input.size()), input);
}

TEST(NoneDecompressor, ShortInputReportsBytesProduced) {
    NoneDecompressor decompressor;
    auto input = generate_random_bytes(100);
    std::vector<std::byte> output(256);

    auto result = decompressor.decompress(output, input);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 100u);
}

// ============================================================================
// PackBits
// ============================================================================

TEST(PackBitsDecompressor, ReferenceExample) {
    // Apple's PackBits technical note example
    auto packed = bytes_of({0xFE, 0xAA, 0x02, 0x80, 0x00, 0x2A, 0xFD, 0xAA, 0x03, 0x80, 0x00, 0x2A, 0x22,
                            0xF7, 0xAA});
    auto expected = bytes_of({0xAA, 0xAA, 0xAA, 0x80, 0x00, 0x2A, 0xAA, 0xAA, 0xAA, 0xAA, 0x80, 0x00, 0x2A,
                              0x22, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA, 0xAA});
    PackBitsDecompressor decompressor;
    EXPECT_EQ(decompress_all(decompressor, packed, expected.size()), expected);
}

TEST(PackBitsDecompressor, NoOpControlByteSkipped) {
    auto packed = bytes_of({0x80, 0x00, 0x11, 0x80, 0xFF, 0x22});
    PackBitsDecompressor decompressor;
    EXPECT_EQ(decompress_all(decompressor, packed, 3), bytes_of({0x11, 0x22, 0x22}));
}

TEST(PackBitsDecompressor, DataWithRuns) {
    auto original = generate_data_with_runs(5000);
    auto packed = packbits_encode(original);
    EXPECT_LT(packed.size(), original.size());

    PackBitsDecompressor decompressor;
    EXPECT_EQ(decompress_all(decompressor, packed, original.size()), original);
}

TEST(PackBitsDecompressor, UnexpectedEndOfInput) {
    auto packed = bytes_of({0x05, 0x01, 0x02});
    PackBitsDecompressor decompressor;
    std::vector<std::byte> output(6);

    auto result = decompressor.decompress(output, packed);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::CompressionError);
}

TEST(PackBitsDecompressor, OutputFullStopsDecoding) {
    auto packed = bytes_of({0xF9, 0x33, 0x01, 0x44, 0x55});
    PackBitsDecompressor decompressor;
    std::vector<std::byte> output(4);

    auto result = decompressor.decompress(output, packed);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 4u);
    EXPECT_EQ(output, bytes_of({0x33, 0x33, 0x33, 0x33}));
}

// ============================================================================
// LZW
// ============================================================================

TEST(LzwDecompressor, HandEncodedStream) {
    // Clear, 'A', 258 (KwKwK), 'A', EOI at 9 bits
    auto packed = bytes_of({0x80, 0x10, 0x60, 0x44, 0x18, 0x08});
    LzwDecompressor decompressor;
    EXPECT_EQ(decompress_all(decompressor, packed, 4), bytes_of({'A', 'A', 'A', 'A'}));
}

TEST(LzwDecompressor, EncoderOutputMatchesHandEncoding) {
    auto packed = lzw_encode(bytes_of({'A', 'A', 'A', 'A'}));
    EXPECT_EQ(packed, bytes_of({0x80, 0x10, 0x60, 0x44, 0x18, 0x08}));
}

TEST(LzwDecompressor, CompressibleData) {
    auto original = generate_data_with_runs(20000, 3);
    auto packed = lzw_encode(original);
    EXPECT_LT(packed.size(), original.size());

    LzwDecompressor decompressor;
    EXPECT_EQ(decompress_all(decompressor, packed, original.size()), original);
}

TEST(LzwDecompressor, RandomDataCrossesCodeWidthsAndTableResets) {
    // Enough codes to grow to 12 bits and fill the table several times
    auto original = generate_random_bytes(30000, 11);
    auto packed = lzw_encode(original);

    LzwDecompressor decompressor;
    EXPECT_EQ(decompress_all(decompressor, packed, original.size()), original);
}

TEST(LzwDecompressor, DecompressorIsReusable) {
    LzwDecompressor decompressor;
    for (uint64_t seed = 0; seed < 4; ++seed) {
        auto original = generate_random_bytes(4096, seed);
        auto packed = lzw_encode(original);
        EXPECT_EQ(decompress_all(decompressor, packed, original.size()), original) << "seed " << seed;
    }
}

TEST(LzwDecompressor, EmptyStream) {
    auto packed = lzw_encode({});
    LzwDecompressor decompressor;
    std::vector<std::byte> output(16);

    auto result = decompressor.decompress(output, packed);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 0u);
}

TEST(LzwDecompressor, OutputSmallerThanStream) {
    auto original = generate_random_bytes(1000);
    auto packed = lzw_encode(original);
    LzwDecompressor decompressor;
    std::vector<std::byte> output(300);

    auto result = decompressor.decompress(output, packed);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 300u);
    EXPECT_TRUE(std::equal(output.begin(), output.end(), original.begin()));
}

TEST(LzwDecompressor, InvalidFirstCode) {
    // 9-bit code 300 without any preceding string
    auto packed = bytes_of({0x96, 0x00});
    LzwDecompressor decompressor;
    std::vector<std::byte> output(16);

    auto result = decompressor.decompress(output, packed);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::CompressionError);
}

// ============================================================================
// Deflate
// ============================================================================

TEST(DeflateDecompressor, CompressibleData) {
    auto original = generate_data_with_runs(50000);
    auto packed = deflate_encode(original);

    DeflateDecompressor decompressor;
    EXPECT_EQ(decompress_all(decompressor, packed, original.size()), original);
}

TEST(DeflateDecompressor, ReusedAcrossTiles) {
    DeflateDecompressor decompressor;
    for (uint64_t seed = 0; seed < 4; ++seed) {
        auto original = generate_random_bytes(8192, seed);
        auto packed = deflate_encode(original);
        EXPECT_EQ(decompress_all(decompressor, packed, original.size()), original) << "seed " << seed;
    }
}

TEST(DeflateDecompressor, TruncatedStreamYieldsPartialOutput) {
    auto original = generate_random_bytes(4096);
    auto packed = deflate_encode(original);
    packed.resize(packed.size() / 2);

    DeflateDecompressor decompressor;
    std::vector<std::byte> output(original.size());
    auto result = decompressor.decompress(output, packed);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_LT(result.value(), original.size());
}

TEST(DeflateDecompressor, CorruptStream) {
    auto packed = bytes_of({0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC});
    DeflateDecompressor decompressor;
    std::vector<std::byte> output(64);

    auto result = decompressor.decompress(output, packed);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::CompressionError);
}

TEST(DeflateDecompressor, StreamSurvivesMoveAndCorruptTile) {
    auto original = generate_random_bytes(4096, 3);
    auto packed = deflate_encode(original);

    DeflateDecompressor first;
    ASSERT_EQ(decompress_all(first, packed, original.size()), original);

    // The inflate state created by the first tile moves with the decompressor
    DeflateDecompressor moved(std::move(first));
    std::vector<std::byte> output(64);
    auto corrupt = moved.decompress(output, bytes_of({0x12, 0x34, 0x56, 0x78}));
    ASSERT_TRUE(corrupt.is_error());
    EXPECT_EQ(corrupt.error().code, Error::Code::CompressionError);

    EXPECT_EQ(decompress_all(moved, packed, original.size()), original);
}

// ============================================================================
// Registry
// ============================================================================

TEST(DecompressorStorage, SupportedSchemes) {
    using Storage = DecompressorStorage<StandardDecompressors>;
    EXPECT_TRUE(Storage::supports(CompressionScheme::Unspecified));
    EXPECT_TRUE(Storage::supports(CompressionScheme::None));
    EXPECT_TRUE(Storage::supports(CompressionScheme::LZW));
    EXPECT_TRUE(Storage::supports(CompressionScheme::Deflate_Adobe));
    EXPECT_TRUE(Storage::supports(CompressionScheme::Deflate));
    EXPECT_TRUE(Storage::supports(CompressionScheme::PackBits));
    EXPECT_FALSE(Storage::supports(static_cast<CompressionScheme>(7)));      // JPEG
    EXPECT_FALSE(Storage::supports(static_cast<CompressionScheme>(50000)));  // ZSTD
}

TEST(DecompressorStorage, DispatchByScheme) {
    DecompressorStorage<StandardDecompressors> storage;
    auto original = generate_data_with_runs(3000);

    const std::array<uint16_t, 5> codes = {1, 5, 8, 32946, 32773};
    for (uint16_t code : codes) {
        auto packed = compress_tile(original, code);
        std::vector<std::byte> output(original.size());
        auto result = storage.decompress(output, packed, static_cast<CompressionScheme>(code));
        ASSERT_TRUE(result.is_ok()) << "compression " << code << ": " << result.error().message;
        EXPECT_EQ(result.value(), original.size());
        EXPECT_EQ(output, original) << "compression " << code;
    }
}

TEST(DecompressorStorage, UnknownSchemeUnsupported) {
    DecompressorStorage<StandardDecompressors> storage;
    std::vector<std::byte> input(8);
    std::vector<std::byte> output(8);

    auto result = storage.decompress(output, input, static_cast<CompressionScheme>(99));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::UnsupportedFeature);
}
