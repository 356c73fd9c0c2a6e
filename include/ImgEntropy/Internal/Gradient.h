#pragma once

/**
 * @file Gradient.h
 * @brief Finite-difference gradients of intensity arrays
 *
 * Provides:
 * - Central difference f(n+1) - f(n-1), cropped to the common interior
 * - Numerical gradient (half central difference inside, one-sided at borders)
 * - Prewitt 3x3 gradient with zero border, saturated to 8 bits
 * - Gradient range J = max(|fx|, |fy|)
 *
 * Used by:
 * - Delentropy (joint gradient histogram)
 * - Gradient magnitude visualization
 */

#include <ImgEntropy/Core/Array2D.h>

#include <cstdint>

namespace Img::Entropy::Internal {

/**
 * @brief Horizontal and vertical integer differences of the same shape
 */
struct GradientPair {
    GradientArray fx;   ///< Difference along columns (axis 1)
    GradientArray fy;   ///< Difference along rows (axis 0)
};

/**
 * @brief Real-valued numerical gradient
 */
struct RealGradient {
    RealArray gx;       ///< Derivative along columns (axis 1)
    RealArray gy;       ///< Derivative along rows (axis 0)
};

// ============================================================================
// Integer Differences
// ============================================================================

/**
 * @brief Central difference f(n+1) - f(n-1) along both axes
 *
 * fx(r, c) = I(r + 1, c + 2) - I(r + 1, c)
 * fy(r, c) = I(r + 2, c + 1) - I(r, c + 1)
 *
 * Both arrays cover the common interior, shape (H - 2, W - 2), since edge
 * pixels lack a symmetric neighbour.
 *
 * @param image Intensity array, at least 3x3
 * @throws InvalidArgumentException if the image is smaller than 3x3
 */
GradientPair CentralDifference(const IntensityArray& image);

/**
 * @brief Numerical gradient truncated toward zero
 *
 * Same as NumericGradient() followed by integer conversion, shape (H, W).
 */
GradientPair NumericGradientInt(const IntensityArray& image);

/**
 * @brief max(|fx| U |fy|)
 */
int32_t MaxAbsGradient(const GradientPair& gradient);

// ============================================================================
// Real Gradients
// ============================================================================

/**
 * @brief Discrete numerical gradient along both axes
 *
 * Interior points use (f(n+1) - f(n-1)) / 2, the first and last point of
 * each axis use the one-sided difference. Output shape equals input shape.
 *
 * @param image Intensity array, at least 2x2
 * @throws InvalidArgumentException if either dimension is below 2
 */
RealGradient NumericGradient(const IntensityArray& image);

// ============================================================================
// Kernel Gradients
// ============================================================================

/**
 * @brief Prewitt 3x3 gradient, zero border, saturated to [0, 255]
 *
 * gx(r, c) = sum_dy I(r + dy, c + 1) - I(r + dy, c - 1)
 * gy(r, c) = sum_dx I(r + 1, c + dx) - I(r - 1, c + dx)
 *
 * Pixels outside the image read as 0. Negative responses saturate to 0 and
 * responses above 255 to 255, as an 8-bit filter output would.
 */
GradientPair PrewittGradient(const IntensityArray& image);

} // namespace Img::Entropy::Internal
