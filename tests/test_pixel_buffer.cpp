#include <gtest/gtest.h>
#include <variant>

#include "../cogreader/include/cogreader/pixel_buffer.hpp"

using namespace cogreader;

// ============================================================================
// Rect
// ============================================================================

TEST(RectTest, IntersectClipsToOverlap) {
    Rect image = Rect::from_size(256, 256);
    Rect window{200, -10, 300, 50};

    Rect clipped = image.intersect(window);
    EXPECT_EQ(clipped, (Rect{200, 0, 256, 50}));
    EXPECT_EQ(clipped.width(), 56);
    EXPECT_EQ(clipped.height(), 50);
}

TEST(RectTest, DisjointIntersectionIsEmpty) {
    Rect image = Rect::from_size(256, 256);
    EXPECT_TRUE(image.intersect(Rect{300, 300, 400, 400}).empty());
    EXPECT_TRUE(image.intersect(Rect{256, 0, 300, 10}).empty());
    EXPECT_TRUE((Rect{10, 10, 10, 20}).empty());
}

TEST(RectTest, Contains) {
    Rect r{10, 20, 30, 40};
    EXPECT_TRUE(r.contains(10, 20));
    EXPECT_TRUE(r.contains(29, 39));
    EXPECT_FALSE(r.contains(30, 20));
    EXPECT_FALSE(r.contains(10, 40));
}

// ============================================================================
// Sample types
// ============================================================================

TEST(SampleTypeTest, FromBitsAndFormat) {
    EXPECT_EQ(sample_type_for(8, SampleFormat::UnsignedInt).value(), SampleType::UInt8);
    EXPECT_EQ(sample_type_for(16, SampleFormat::UnsignedInt).value(), SampleType::UInt16);
    EXPECT_EQ(sample_type_for(8, SampleFormat::SignedInt).value(), SampleType::Int8);
    EXPECT_EQ(sample_type_for(16, SampleFormat::SignedInt).value(), SampleType::Int16);
}

TEST(SampleTypeTest, Unsupported) {
    auto zero = sample_type_for(0, SampleFormat::UnsignedInt);
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error().code, Error::Code::InvalidFormat);

    auto wide = sample_type_for(32, SampleFormat::UnsignedInt);
    ASSERT_TRUE(wide.is_error());
    EXPECT_EQ(wide.error().code, Error::Code::UnsupportedFeature);

    auto floating = sample_type_for(16, SampleFormat::IEEEFloat);
    ASSERT_TRUE(floating.is_error());
    EXPECT_EQ(floating.error().code, Error::Code::UnsupportedFeature);
}

TEST(SampleTypeTest, Names) {
    EXPECT_EQ(sample_type_name(SampleType::UInt8), "UInt8");
    EXPECT_EQ(sample_type_name(SampleType::UInt16), "UInt16");
    EXPECT_EQ(sample_type_name(SampleType::Int8), "Int8");
    EXPECT_EQ(sample_type_name(SampleType::Int16), "Int16");
}

TEST(SampleTypeTest, ColorModels) {
    EXPECT_EQ(GrayImage<uint8_t>::color_model(), (ColorModel{SampleType::UInt8, 0, 255}));
    EXPECT_EQ(GrayImage<uint16_t>::color_model(), (ColorModel{SampleType::UInt16, 0, 65535}));
    EXPECT_EQ(GrayImage<int8_t>::color_model(), (ColorModel{SampleType::Int8, -128, 127}));
    EXPECT_EQ(GrayImage<int16_t>::color_model(), (ColorModel{SampleType::Int16, -32768, 32767}));
}

// ============================================================================
// Images
// ============================================================================

TEST(GrayImageTest, AbsoluteCoordinates) {
    GrayImage<uint16_t> image(Rect{100, 50, 104, 52});
    EXPECT_EQ(image.width(), 4);
    EXPECT_EQ(image.height(), 2);
    EXPECT_EQ(image.pixels().size(), 8u);

    image.set(103, 51, 4242);
    EXPECT_EQ(image.at(103, 51), 4242);
    EXPECT_EQ(image.row(51)[3], 4242);
    EXPECT_EQ(image.pixels()[7], 4242);
    EXPECT_EQ(image.at(100, 50), 0);
}

TEST(GrayImageTest, MakeBufferMatchesSampleType) {
    auto buffer = make_pixel_buffer(SampleType::Int16, Rect{0, 0, 8, 8}, -9999.0);
    ASSERT_TRUE(std::holds_alternative<GrayImage<int16_t>>(buffer));
    EXPECT_EQ(sample_type_of(buffer), SampleType::Int16);
    EXPECT_EQ(bounds_of(buffer), (Rect{0, 0, 8, 8}));

    const auto& image = std::get<GrayImage<int16_t>>(buffer);
    ASSERT_TRUE(image.nodata().has_value());
    EXPECT_DOUBLE_EQ(*image.nodata(), -9999.0);
}
