/**
 * @file test_histogram.cpp
 * @brief Unit tests for gray and joint-gradient histograms
 */

#include <ImgEntropy/Internal/Histogram.h>
#include <ImgEntropy/Core/Exception.h>

#include <gtest/gtest.h>

#include <numeric>
#include <vector>

using namespace Img::Entropy;
using namespace Img::Entropy::Internal;

TEST(GrayHistogramTest, CountsValuesInRange) {
    IntensityArray img(2, 3, std::vector<int32_t>{0, 255, 255, 17, 300, -4});
    std::vector<int64_t> hist = GrayHistogram(img);

    ASSERT_EQ(hist.size(), 256u);
    EXPECT_EQ(hist[0], 1);
    EXPECT_EQ(hist[17], 1);
    EXPECT_EQ(hist[255], 2);
    // 300 and -4 fall outside [0, 256)
    EXPECT_EQ(std::accumulate(hist.begin(), hist.end(), int64_t{0}), 4);
}

TEST(GrayHistogramTest, CumulativeSumAndRange) {
    std::vector<int64_t> hist(256, 0);
    hist[10] = 2;
    hist[20] = 3;

    std::vector<double> cdf = CumulativeSum(hist);
    EXPECT_DOUBLE_EQ(cdf[9], 0.0);
    EXPECT_DOUBLE_EQ(cdf[15], 2.0);
    EXPECT_DOUBLE_EQ(cdf[255], 5.0);

    int32_t first = 0;
    int32_t last = 0;
    ASSERT_TRUE(NonzeroRange(hist, first, last));
    EXPECT_EQ(first, 10);
    EXPECT_EQ(last, 20);
}

TEST(GrayHistogramTest, EmptyHistogramHasNoRange) {
    std::vector<int64_t> hist(256, 0);
    int32_t first = 0;
    int32_t last = 0;
    EXPECT_FALSE(NonzeroRange(hist, first, last));
}

TEST(JointGradientHistogramTest, OneBinPerInteger) {
    GradientArray fx(1, 4, std::vector<int32_t>{-2, 0, 2, 2});
    GradientArray fy(1, 4, std::vector<int32_t>{1, 0, -2, -2});

    Array2D<int64_t> hist = JointGradientHistogram(fx, fy, 2);
    ASSERT_EQ(hist.Height(), 5);
    ASSERT_EQ(hist.Width(), 5);
    EXPECT_EQ(hist(0, 3), 1);   // (-2, 1)
    EXPECT_EQ(hist(2, 2), 1);   // (0, 0)
    EXPECT_EQ(hist(4, 0), 2);   // (2, -2)
    EXPECT_EQ(std::accumulate(hist.begin(), hist.end(), int64_t{0}), 4);
}

TEST(JointGradientHistogramTest, ZeroRangeIsSingleBin) {
    GradientArray zero(3, 3, 0);
    Array2D<int64_t> hist = JointGradientHistogram(zero, zero, 0);
    ASSERT_EQ(hist.Size(), 1u);
    EXPECT_EQ(hist(0, 0), 9);
}

TEST(JointGradientHistogramTest, RejectsBadInput) {
    GradientArray fx(2, 2, 3);
    GradientArray fy(2, 3, 0);
    EXPECT_THROW(JointGradientHistogram(fx, fy, 3), InvalidArgumentException);

    GradientArray fy2(2, 2, 0);
    EXPECT_THROW(JointGradientHistogram(fx, fy2, 2), InvalidArgumentException);
}

TEST(HistogramDensityTest, SumsToOne) {
    Array2D<int64_t> hist(2, 2, std::vector<int64_t>{1, 0, 3, 4});
    RealArray density = HistogramDensity(hist);
    EXPECT_NEAR(std::accumulate(density.begin(), density.end(), 0.0), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(density(1, 0), 0.375);
    EXPECT_EQ(density(0, 1), 0.0);
}

TEST(HistogramDensityTest, EmptyHistogramIsZero) {
    Array2D<int64_t> hist(2, 2, int64_t{0});
    RealArray density = HistogramDensity(hist);
    for (double d : density) {
        EXPECT_EQ(d, 0.0);
    }
}
