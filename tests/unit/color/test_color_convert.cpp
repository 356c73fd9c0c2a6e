/**
 * @file test_color_convert.cpp
 * @brief Unit tests for grey conversion
 */

#include <ImgEntropy/Color/ColorConvert.h>
#include <ImgEntropy/Core/Exception.h>

#include <gtest/gtest.h>

#include <vector>

using namespace Img::Entropy;

namespace {

Image CreateRgbPixel(uint8_t r, uint8_t g, uint8_t b) {
    std::vector<uint8_t> data{r, g, b};
    return Image(1, 1, ChannelType::RGB, data.data(), data.size());
}

} // anonymous namespace

TEST(ColorConvertTest, LuminosityWeights) {
    Image grey = Color::Rgb1ToGray(CreateRgbPixel(255, 0, 0));
    EXPECT_EQ(grey.GetChannelType(), ChannelType::Gray);
    EXPECT_EQ(grey.RowPtr(0)[0], 76);    // 0.299 * 255 = 76.2

    EXPECT_EQ(Color::Rgb1ToGray(CreateRgbPixel(0, 255, 0)).RowPtr(0)[0], 150);
    EXPECT_EQ(Color::Rgb1ToGray(CreateRgbPixel(255, 255, 255)).RowPtr(0)[0], 255);
}

TEST(ColorConvertTest, Bt709Weights) {
    Image grey = Color::Rgb1ToGray(CreateRgbPixel(0, 255, 0), "bt709");
    EXPECT_EQ(grey.RowPtr(0)[0], 182);   // 0.7152 * 255 = 182.4
}

TEST(ColorConvertTest, UnknownMethodThrows) {
    EXPECT_THROW(Color::Rgb1ToGray(CreateRgbPixel(1, 2, 3), "sepia"), InvalidArgumentException);
}

TEST(ColorConvertTest, GrayToRgbReplicates) {
    std::vector<uint8_t> data{7, 200};
    Image grey(2, 1, ChannelType::Gray, data.data(), data.size());
    Image rgb = Color::GrayToRgb(grey);

    ASSERT_EQ(rgb.Channels(), 3);
    EXPECT_EQ(rgb.RowPtr(0)[3], 200);
    EXPECT_EQ(rgb.RowPtr(0)[4], 200);
    EXPECT_EQ(rgb.RowPtr(0)[5], 200);
}

TEST(ColorConvertTest, ToIntensityArray) {
    std::vector<uint8_t> data{0, 10, 20, 255, 128, 1};
    Image grey(3, 2, ChannelType::Gray, data.data(), data.size());
    IntensityArray arr = Color::ToIntensityArray(grey);

    ASSERT_EQ(arr.Height(), 2);
    ASSERT_EQ(arr.Width(), 3);
    EXPECT_EQ(arr(0, 2), 20);
    EXPECT_EQ(arr(1, 0), 255);

    IntensityArray fromRgb = Color::ToIntensityArray(CreateRgbPixel(255, 255, 255));
    EXPECT_EQ(fromRgb(0, 0), 255);
}
