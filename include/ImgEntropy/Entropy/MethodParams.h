#pragma once

/**
 * @file MethodParams.h
 * @brief Per-method parameter sets
 *
 * Every algorithm variant is selected through an explicit field here rather
 * than a switch buried in the algorithm body. Setters return *this so
 * parameters can be chained:
 *
 * @code
 * auto params = GradientParams()
 *     .SetGradientMode(GradientMode::Real)
 *     .SetCombineMode(CombineMode::Convex);
 * @endcode
 */

#include <ImgEntropy/Core/Constants.h>

#include <cstdint>

namespace Img::Entropy {

// =============================================================================
// Variant Selectors
// =============================================================================

/**
 * @brief How the gradient-magnitude method differentiates
 */
enum class GradientMode {
    Real,       ///< Numerical gradient (central inside, one-sided at borders)
    Kernel      ///< Prewitt 3x3 filter, zero border, 8-bit saturated
};

/**
 * @brief How the two real gradient components are combined for display
 *
 * Only used with GradientMode::Real; kernel gradients are always combined
 * with a bitwise OR.
 */
enum class CombineMode {
    Convex,     ///< gx + gy
    Concave     ///< ~int(gx + gy), i.e. -(gx + gy) - 1
};

/**
 * @brief Difference scheme of the delentropy gradient field
 */
enum class DifferenceMode {
    Central,    ///< f(n+1) - f(n-1), cropped to the common interior
    Numeric     ///< Numerical gradient truncated to integers, full shape, axis order
};

// =============================================================================
// Parameter Sets
// =============================================================================

/**
 * @brief 1D Kapur threshold entropy (no tunables)
 */
struct Kapur1DParams {};

/**
 * @brief 1D Shannon entropy with configurable logarithm base
 */
struct Scipy1DParams {
    double base = DEFAULT_LOG_BASE;     ///< Logarithm base (> 0, != 1)

    Scipy1DParams& SetBase(double b) { base = b; return *this; }
};

/**
 * @brief 1D Shannon entropy of normalized intensities (no tunables)
 */
struct Shannon1DParams {};

/**
 * @brief 2D delentropy
 */
struct DelentropyParams {
    DifferenceMode differenceMode = DifferenceMode::Central;
    bool invertOutput = true;           ///< Bitwise-invert the displayed gradient

    DelentropyParams& SetDifferenceMode(DifferenceMode m) { differenceMode = m; return *this; }
    DelentropyParams& SetInvertOutput(bool inv) { invertOutput = inv; return *this; }
};

/**
 * @brief 2D gradient magnitude visualization
 */
struct GradientParams {
    GradientMode gradientMode = GradientMode::Real;
    CombineMode combineMode = CombineMode::Concave;

    GradientParams& SetGradientMode(GradientMode m) { gradientMode = m; return *this; }
    GradientParams& SetCombineMode(CombineMode m) { combineMode = m; return *this; }
};

/**
 * @brief Local entropy over a disk neighbourhood
 */
struct RegionalDiskParams {
    int32_t radius = DEFAULT_DISK_RADIUS;   ///< Disk radius in pixels (>= 1)

    RegionalDiskParams& SetRadius(int32_t r) { radius = r; return *this; }
};

/**
 * @brief Local entropy over a square sliding window
 */
struct RegionalShannonParams {
    int32_t kernelSize = DEFAULT_KERNEL_SIZE;   ///< Odd window size (>= 3)

    RegionalShannonParams& SetKernelSize(int32_t k) { kernelSize = k; return *this; }
};

} // namespace Img::Entropy
