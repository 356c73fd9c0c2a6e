/**
 * @file Gradient.cpp
 * @brief Finite-difference gradient implementation
 */

#include <ImgEntropy/Internal/Gradient.h>
#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Core/Exception.h>

#include <algorithm>
#include <cstdlib>
#include <string>

namespace Img::Entropy::Internal {

namespace {

void RequireMinSize(const IntensityArray& image, int32_t minSize, const char* op) {
    if (image.Height() < minSize || image.Width() < minSize) {
        throw InvalidArgumentException(std::string(op) + " requires at least " +
                                       std::to_string(minSize) + "x" + std::to_string(minSize) +
                                       " pixels, got " + std::to_string(image.Height()) + "x" +
                                       std::to_string(image.Width()));
    }
}

// Zero outside the image
inline int32_t PixelOrZero(const IntensityArray& image, int32_t row, int32_t col) {
    if (row < 0 || row >= image.Height() || col < 0 || col >= image.Width()) {
        return 0;
    }
    return image(row, col);
}

// 1D numerical derivative of sample i out of n, step is the element stride
inline double Derivative1D(const int32_t* f, int32_t i, int32_t n, int32_t step) {
    if (i == 0) {
        return static_cast<double>(f[step] - f[0]);
    }
    if (i == n - 1) {
        return static_cast<double>(f[i * step] - f[(i - 1) * step]);
    }
    return static_cast<double>(f[(i + 1) * step] - f[(i - 1) * step]) / 2.0;
}

} // anonymous namespace

// ============================================================================
// Integer Differences
// ============================================================================

GradientPair CentralDifference(const IntensityArray& image) {
    RequireMinSize(image, 3, "CentralDifference");

    const int32_t h = image.Height() - 2;
    const int32_t w = image.Width() - 2;

    GradientPair result{GradientArray(h, w), GradientArray(h, w)};

    for (int32_t r = 0; r < h; ++r) {
        const int32_t* above = image.RowPtr(r);
        const int32_t* center = image.RowPtr(r + 1);
        const int32_t* below = image.RowPtr(r + 2);
        int32_t* fxRow = result.fx.RowPtr(r);
        int32_t* fyRow = result.fy.RowPtr(r);

        for (int32_t c = 0; c < w; ++c) {
            fxRow[c] = center[c + 2] - center[c];
            fyRow[c] = below[c + 1] - above[c + 1];
        }
    }
    return result;
}

GradientPair NumericGradientInt(const IntensityArray& image) {
    RealGradient real = NumericGradient(image);
    return GradientPair{real.gx.Cast<int32_t>(), real.gy.Cast<int32_t>()};
}

int32_t MaxAbsGradient(const GradientPair& gradient) {
    int32_t range = 0;
    for (int32_t v : gradient.fx) {
        range = std::max(range, std::abs(v));
    }
    for (int32_t v : gradient.fy) {
        range = std::max(range, std::abs(v));
    }
    return range;
}

// ============================================================================
// Real Gradients
// ============================================================================

RealGradient NumericGradient(const IntensityArray& image) {
    RequireMinSize(image, 2, "NumericGradient");

    const int32_t h = image.Height();
    const int32_t w = image.Width();

    RealGradient result{RealArray(h, w), RealArray(h, w)};

    for (int32_t r = 0; r < h; ++r) {
        const int32_t* row = image.RowPtr(r);
        for (int32_t c = 0; c < w; ++c) {
            result.gx(r, c) = Derivative1D(row, c, w, 1);
        }
    }

    for (int32_t c = 0; c < w; ++c) {
        const int32_t* column = image.Data() + c;
        for (int32_t r = 0; r < h; ++r) {
            result.gy(r, c) = Derivative1D(column, r, h, w);
        }
    }
    return result;
}

// ============================================================================
// Kernel Gradients
// ============================================================================

GradientPair PrewittGradient(const IntensityArray& image) {
    const int32_t h = image.Height();
    const int32_t w = image.Width();

    GradientPair result{GradientArray(h, w), GradientArray(h, w)};

    for (int32_t r = 0; r < h; ++r) {
        for (int32_t c = 0; c < w; ++c) {
            int32_t sx = 0;
            int32_t sy = 0;
            for (int32_t d = -1; d <= 1; ++d) {
                sx += PixelOrZero(image, r + d, c + 1) - PixelOrZero(image, r + d, c - 1);
                sy += PixelOrZero(image, r + 1, c + d) - PixelOrZero(image, r - 1, c + d);
            }
            result.fx(r, c) = Clamp(sx, 0, MAX_INTENSITY);
            result.fy(r, c) = Clamp(sy, 0, MAX_INTENSITY);
        }
    }
    return result;
}

} // namespace Img::Entropy::Internal
