/**
 * @file Histogram.cpp
 * @brief Gray-level and joint-gradient histogram implementation
 */

#include <ImgEntropy/Internal/Histogram.h>
#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Core/Exception.h>

#include <cstdlib>
#include <string>

namespace Img::Entropy::Internal {

// ============================================================================
// Gray Histogram
// ============================================================================

std::vector<int64_t> GrayHistogram(const IntensityArray& image) {
    std::vector<int64_t> histogram(GRAY_LEVELS, 0);
    for (int32_t v : image) {
        if (v >= 0 && v < GRAY_LEVELS) {
            histogram[v]++;
        }
    }
    return histogram;
}

std::vector<double> CumulativeSum(const std::vector<int64_t>& histogram) {
    std::vector<double> cdf(histogram.size(), 0.0);
    double running = 0.0;
    for (size_t i = 0; i < histogram.size(); ++i) {
        running += static_cast<double>(histogram[i]);
        cdf[i] = running;
    }
    return cdf;
}

bool NonzeroRange(const std::vector<int64_t>& histogram, int32_t& first, int32_t& last) {
    first = -1;
    last = -1;
    for (size_t i = 0; i < histogram.size(); ++i) {
        if (histogram[i] != 0) {
            if (first < 0) first = static_cast<int32_t>(i);
            last = static_cast<int32_t>(i);
        }
    }
    return first >= 0;
}

// ============================================================================
// Joint Gradient Histogram
// ============================================================================

Array2D<int64_t> JointGradientHistogram(const GradientArray& fx, const GradientArray& fy,
                                        int32_t range) {
    if (!fx.SameShape(fy)) {
        throw InvalidArgumentException("fx and fy must have the same shape");
    }
    if (range < 0) {
        throw InvalidArgumentException("Histogram range must be non-negative");
    }

    const int32_t bins = 2 * range + 1;
    Array2D<int64_t> histogram(bins, bins, 0);

    const int32_t* px = fx.Data();
    const int32_t* py = fy.Data();
    for (size_t i = 0; i < fx.Size(); ++i) {
        if (std::abs(px[i]) > range || std::abs(py[i]) > range) {
            throw InvalidArgumentException("Gradient (" + std::to_string(px[i]) + ", " +
                                           std::to_string(py[i]) + ") outside histogram range " +
                                           std::to_string(range));
        }
        histogram(px[i] + range, py[i] + range)++;
    }
    return histogram;
}

RealArray HistogramDensity(const Array2D<int64_t>& histogram) {
    RealArray density(histogram.Height(), histogram.Width(), 0.0);

    int64_t total = 0;
    for (int64_t c : histogram) {
        total += c;
    }
    if (total == 0) return density;

    const int64_t* src = histogram.Data();
    double* dst = density.Data();
    for (size_t i = 0; i < histogram.Size(); ++i) {
        dst[i] = static_cast<double>(src[i]) / static_cast<double>(total);
    }
    return density;
}

} // namespace Img::Entropy::Internal
