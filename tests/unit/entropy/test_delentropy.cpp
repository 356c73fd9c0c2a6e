/**
 * @file test_delentropy.cpp
 * @brief Unit tests for 2D delentropy
 */

#include <ImgEntropy/Entropy/Methods.h>
#include <ImgEntropy/Core/Exception.h>

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <vector>

using namespace Img::Entropy;

namespace {

// I(r, c) = a * c + b * r
IntensityArray CreateRamp(int32_t height, int32_t width, int32_t a, int32_t b) {
    IntensityArray img(height, width);
    for (int32_t r = 0; r < height; ++r) {
        for (int32_t c = 0; c < width; ++c) {
            img(r, c) = a * c + b * r;
        }
    }
    return img;
}

// Deterministic texture within 0..255
IntensityArray CreateTexture(int32_t height, int32_t width) {
    IntensityArray img(height, width);
    for (int32_t r = 0; r < height; ++r) {
        for (int32_t c = 0; c < width; ++c) {
            img(r, c) = (r * r * 13 + c * 29 + r * c * 7) % 256;
        }
    }
    return img;
}

GradientArray Negate(const GradientArray& g) {
    GradientArray out = g;
    for (int32_t r = 0; r < out.Height(); ++r)
        for (int32_t c = 0; c < out.Width(); ++c) out(r, c) = -out(r, c);
    return out;
}

} // anonymous namespace

class DelentropyTest : public ::testing::Test {};

// =============================================================================
// Joint Estimator
// =============================================================================

TEST_F(DelentropyTest, SingleGradientPairIsZero) {
    GradientArray fx(2, 2, 3);
    GradientArray fy(2, 2, -1);
    DelentropyEstimate e = DelentropyFromGradients(fx, fy);
    EXPECT_EQ(e.range, 3);
    EXPECT_EQ(e.density.Height(), 7);
    EXPECT_EQ(e.entropy, 0.0);
}

TEST_F(DelentropyTest, UniformPairsGiveHalfLog2N) {
    // Four distinct pairs, each once
    GradientArray fx(1, 4, std::vector<int32_t>{1, -1, 0, 0});
    GradientArray fy(1, 4, std::vector<int32_t>{0, 0, 1, -1});
    DelentropyEstimate e = DelentropyFromGradients(fx, fy);
    EXPECT_NEAR(e.entropy, std::log2(4.0) / 2.0, 1e-12);
}

TEST_F(DelentropyTest, DensitySumsToOne) {
    auto grad = CreateTexture(20, 20);
    MethodResult result = Delentropy2D(grad);
    const RealArray& density = result.artifacts[1].data;
    EXPECT_NEAR(std::accumulate(density.begin(), density.end(), 0.0), 1.0, 1e-9);
    EXPECT_GT(result.summary.value, 0.0);
}

TEST_F(DelentropyTest, ContributionSumsToEntropy) {
    GradientArray fx(1, 5, std::vector<int32_t>{1, 1, 2, -3, 0});
    GradientArray fy(1, 5, std::vector<int32_t>{0, 0, 2, 1, 0});
    DelentropyEstimate e = DelentropyFromGradients(fx, fy);
    EXPECT_NEAR(std::accumulate(e.contribution.begin(), e.contribution.end(), 0.0),
                e.entropy, 1e-12);
}

TEST_F(DelentropyTest, InvariantUnderGradientNegation) {
    // Symmetric field: every (a, b) is paired with (-a, -b)
    GradientArray fx(2, 3, std::vector<int32_t>{4, -4, 1, -1, 0, 0});
    GradientArray fy(2, 3, std::vector<int32_t>{2, -2, -5, 5, 0, 0});

    DelentropyEstimate original = DelentropyFromGradients(fx, fy);
    DelentropyEstimate negated = DelentropyFromGradients(Negate(fx), Negate(fy));
    EXPECT_NEAR(original.entropy, negated.entropy, 1e-12);

    // The density is point-symmetric for this field
    const int32_t n = original.density.Height();
    for (int32_t i = 0; i < n; ++i)
        for (int32_t j = 0; j < n; ++j)
            EXPECT_DOUBLE_EQ(original.density(i, j), original.density(n - 1 - i, n - 1 - j));
}

TEST_F(DelentropyTest, NegationInvarianceOnImageGradients) {
    IntensityArray img = CreateTexture(16, 12);
    IntensityArray inverted = img;
    for (int32_t r = 0; r < img.Height(); ++r)
        for (int32_t c = 0; c < img.Width(); ++c) inverted(r, c) = 255 - img(r, c);

    EXPECT_NEAR(Delentropy2D(img).summary.value, Delentropy2D(inverted).summary.value, 1e-12);
}

TEST_F(DelentropyTest, RangeAboveEightBitsThrows) {
    // 16-bit style checkerboard: |fx| reaches 65535
    IntensityArray img(4, 4, 0);
    for (int32_t r = 0; r < 4; ++r)
        for (int32_t c = 0; c < 4; ++c) img(r, c) = (c % 2 == 0) ? 0 : 65535;
    img(1, 3) = 0;

    try {
        Delentropy2D(img);
        FAIL() << "expected GradientRangeException";
    } catch (const GradientRangeException& e) {
        EXPECT_GT(e.Range(), MAX_GRADIENT);
        EXPECT_EQ(e.Limit(), MAX_GRADIENT);
    }
}

TEST_F(DelentropyTest, RangeAtBoundIsAccepted) {
    IntensityArray img = CreateRamp(3, 3, 0, 0);
    img(1, 2) = 255;
    EXPECT_NO_THROW(Delentropy2D(img));
}

// =============================================================================
// Method Output
// =============================================================================

TEST_F(DelentropyTest, ConstantImageIsZero) {
    MethodResult result = Delentropy2D(IntensityArray(6, 6, 128));
    EXPECT_EQ(result.summary.value, 0.0);
    EXPECT_EQ(result.artifacts[1].data.Size(), 1u);
    EXPECT_DOUBLE_EQ(result.artifacts[1].data(0, 0), 1.0);
}

TEST_F(DelentropyTest, ArtifactsAndHints) {
    MethodResult result = Delentropy2D(CreateRamp(5, 6, 1, 2));

    ASSERT_EQ(result.artifacts.size(), 3u);
    EXPECT_EQ(result.artifacts[0].label, "Gradient");
    EXPECT_TRUE(result.artifacts[0].hints.empty());
    EXPECT_EQ(result.artifacts[1].label, "Deldensity");
    EXPECT_TRUE(result.artifacts[1].HasHint(RenderHint::HasBar));
    EXPECT_TRUE(result.artifacts[1].HasHint(RenderHint::ForceColour));
    EXPECT_EQ(result.artifacts[2].label, "Delentropy");
    EXPECT_TRUE(result.artifacts[2].HasHint(RenderHint::HasBar));

    // Interior shape, J = 4 gives 9 x 9 bins
    EXPECT_EQ(result.artifacts[0].data.Height(), 3);
    EXPECT_EQ(result.artifacts[0].data.Width(), 4);
    EXPECT_EQ(result.artifacts[1].data.Height(), 9);
}

TEST_F(DelentropyTest, GradientDisplayIsBitwiseInverted) {
    // fx = 2, fy = 4, fx + fy = 6
    IntensityArray img = CreateRamp(5, 5, 1, 2);

    MethodResult inverted = Delentropy2D(img);
    for (double v : inverted.artifacts[0].data) EXPECT_EQ(v, -7.0);

    MethodResult plain = Delentropy2D(img, DelentropyParams().SetInvertOutput(false));
    for (double v : plain.artifacts[0].data) EXPECT_EQ(v, 6.0);

    EXPECT_EQ(inverted.summary.value, plain.summary.value);
}

TEST_F(DelentropyTest, NumericDifferenceModeKeepsFullShape) {
    IntensityArray img = CreateTexture(8, 10);
    MethodResult result =
        Delentropy2D(img, DelentropyParams().SetDifferenceMode(DifferenceMode::Numeric));
    EXPECT_EQ(result.artifacts[0].data.Height(), 8);
    EXPECT_EQ(result.artifacts[0].data.Width(), 10);
    EXPECT_GE(result.summary.value, 0.0);
}

TEST_F(DelentropyTest, DensityOrientationPerDifferenceMode) {
    // Vertical ramp: only the row derivative is non-zero
    IntensityArray img = CreateRamp(5, 4, 0, 3);

    // Numeric follows axis order, the row derivative indexes density rows
    MethodResult numeric =
        Delentropy2D(img, DelentropyParams().SetDifferenceMode(DifferenceMode::Numeric));
    const RealArray& numericDensity = numeric.artifacts[1].data;
    ASSERT_EQ(numericDensity.Height(), 7);
    EXPECT_DOUBLE_EQ(numericDensity(3 + 3, 3), 1.0);

    // Central puts the row derivative in fy, the density columns
    MethodResult central = Delentropy2D(img);
    const RealArray& centralDensity = central.artifacts[1].data;
    ASSERT_EQ(centralDensity.Height(), 13);
    EXPECT_DOUBLE_EQ(centralDensity(6, 6 + 6), 1.0);
}

TEST_F(DelentropyTest, TooSmallImageThrows) {
    EXPECT_THROW(Delentropy2D(IntensityArray(2, 8, 1)), InvalidArgumentException);
}

TEST_F(DelentropyTest, RepeatedRunsAreBitIdentical) {
    IntensityArray img = CreateTexture(24, 18);
    IntensityArray before = img;

    MethodResult a = Delentropy2D(img);
    MethodResult b = Delentropy2D(img);

    EXPECT_EQ(a.summary.value, b.summary.value);
    ASSERT_EQ(a.artifacts.size(), b.artifacts.size());
    for (size_t i = 0; i < a.artifacts.size(); ++i) {
        EXPECT_EQ(a.artifacts[i].data, b.artifacts[i].data);
    }
    EXPECT_EQ(img, before);
}
