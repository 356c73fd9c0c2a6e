#pragma once

/**
 * @file Histogram.h
 * @brief Gray-level and joint-gradient histograms
 *
 * Provides:
 * - 256-bin gray histogram over [0, 256)
 * - Cumulative distribution and non-zero bin range
 * - Joint (fx, fy) histogram with one bin per integer value
 */

#include <ImgEntropy/Core/Array2D.h>

#include <cstdint>
#include <vector>

namespace Img::Entropy::Internal {

// ============================================================================
// Gray Histogram
// ============================================================================

/**
 * @brief Histogram of intensities with GRAY_LEVELS unit bins over [0, 256)
 *
 * Values outside [0, 255] fall outside the range and are not counted.
 */
std::vector<int64_t> GrayHistogram(const IntensityArray& image);

/**
 * @brief Running sum of histogram counts (as double)
 */
std::vector<double> CumulativeSum(const std::vector<int64_t>& histogram);

/**
 * @brief First and last non-zero bin of a histogram
 * @param[out] first Index of the first non-zero bin
 * @param[out] last Index of the last non-zero bin
 * @return false if every bin is zero
 */
bool NonzeroRange(const std::vector<int64_t>& histogram, int32_t& first, int32_t& last);

// ============================================================================
// Joint Gradient Histogram
// ============================================================================

/**
 * @brief 2D histogram of (fx, fy) pairs
 *
 * Has 2 * range + 1 bins per axis spanning [-range, range] inclusive, one bin
 * per integer gradient value. Row index is the fx bin, column index the fy
 * bin: counts(fx + range, fy + range).
 *
 * @param fx Horizontal differences
 * @param fy Vertical differences (same shape as fx)
 * @param range Bin range J; every |fx|, |fy| must be <= J
 * @throws InvalidArgumentException on shape mismatch or out-of-range values
 */
Array2D<int64_t> JointGradientHistogram(const GradientArray& fx, const GradientArray& fy,
                                        int32_t range);

/**
 * @brief Normalize histogram counts into a joint density summing to 1
 *
 * An empty histogram yields an all-zero density.
 */
RealArray HistogramDensity(const Array2D<int64_t>& histogram);

} // namespace Img::Entropy::Internal
