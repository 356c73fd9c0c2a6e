#pragma once

/**
 * @file Methods.h
 * @brief Image entropy estimators
 *
 * Seven independent, stateless estimators. Each reads an intensity array
 * (never modifies it) and returns the derived display arrays plus a scalar
 * summary. The same input always yields bit-identical output.
 *
 * | Method              | Summary                                         |
 * |---------------------|-------------------------------------------------|
 * | Kapur1D             | max partition entropy and its threshold         |
 * | Scipy1D             | entropy of normalized intensities, any base     |
 * | Shannon1D           | entropy of normalized intensities, base 2       |
 * | Delentropy2D        | halved entropy of the joint gradient density    |
 * | Gradient2D          | mean/std of the combined gradient (not entropy) |
 * | RegionalDisk2D      | mean of the disk-neighbourhood entropy map      |
 * | RegionalShannon2D   | mean/std of the square-window entropy map       |
 *
 * References:
 * - Delentropy: Larkin, "Reflections on Shannon Information", arXiv:1609.01117
 * - Kapur: doi:10.1080/09720502.2020.1731976
 */

#include <ImgEntropy/Core/Array2D.h>
#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Core/Image.h>
#include <ImgEntropy/Core/Types.h>
#include <ImgEntropy/Entropy/MethodParams.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace Img::Entropy {

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief What the scalar summary measures
 */
enum class SummaryKind {
    Entropy,    ///< A true entropy value
    Gradient    ///< A gradient statistic (Gradient2D only)
};

/**
 * @brief Scalar outcome of a method
 */
struct EntropySummary {
    SummaryKind kind = SummaryKind::Entropy;
    double value = 0.0;                     ///< Entropy, or mean gradient
    std::optional<double> stdDev;           ///< Spread across cells, if meaningful
    std::optional<int32_t> threshold;       ///< Kapur threshold

    /// Value relative to the assumed 8-bit dynamic range
    double Ratio() const { return value / ENTROPY_RATIO_BITS; }
};

/**
 * @brief Uniform output of every method
 *
 * colour and grey are the arrays to show next to the artifacts; a method with
 * no visual output leaves all three empty.
 */
struct MethodResult {
    std::optional<Image> colour;
    std::optional<IntensityArray> grey;
    std::vector<Artifact> artifacts;
    EntropySummary summary;

    bool HasDisplay() const {
        return colour.has_value() || grey.has_value() || !artifacts.empty();
    }
};

/**
 * @brief Joint-gradient entropy estimate
 */
struct DelentropyEstimate {
    int32_t range = 0;          ///< J = max(|fx|, |fy|)
    RealArray density;          ///< (2J+1) x (2J+1), rows = fx bin, cols = fy bin
    RealArray contribution;     ///< -density * log2(density) / 2 per bin
    double entropy = 0.0;       ///< Sum of contribution
};

/**
 * @brief Kapur threshold search outcome
 */
struct KapurThreshold {
    int32_t threshold = 0;
    double entropy = 0.0;       ///< Maximal sum of partition entropies (nats)
};

// =============================================================================
// 1D Methods
// =============================================================================

/**
 * @brief Kapur bi-level threshold entropy
 *
 * Builds a 256-bin histogram, then for each candidate threshold i between the
 * first and last non-zero bin sums the entropies of hist[0..i] and
 * hist[i+1..] (each normalized by its own mass, zero bins skipped). The first
 * threshold reaching the maximum wins.
 *
 * Artifact: the image with pixels >= threshold set to 0.
 *
 * @throws InvalidArgumentException if no intensity lies in [0, 255]
 */
MethodResult Kapur1D(const IntensityArray& grey, const Kapur1DParams& params = {});

/**
 * @brief Threshold search used by Kapur1D
 */
KapurThreshold FindKapurThreshold(const IntensityArray& grey);

/**
 * @brief Shannon entropy of normalized intensities with a configurable base
 *
 * Intensities are treated as weights: p = I / sum(I). No display output.
 */
MethodResult Scipy1D(const IntensityArray& grey, const Scipy1DParams& params = {});

/**
 * @brief Shannon entropy (base 2) of normalized intensities
 *
 * Artifact: per-pixel contribution -p * log2(p).
 */
MethodResult Shannon1D(const IntensityArray& grey, const Shannon1DParams& params = {});

// =============================================================================
// 2D Methods
// =============================================================================

/**
 * @brief 2D delentropy
 *
 * 1. fx, fy from the selected difference scheme. Central takes fx along
 *    columns and fy along rows; Numeric follows array axis order, fx along
 *    rows and fy along columns, so its deldensity is the transpose.
 * 2. J = max(|fx|, |fy|), must be <= MAX_GRADIENT
 * 3. Joint histogram with one bin per integer in [-J, J]
 * 4. Density = histogram / total
 * 5. Entropy = -sum(density * log2(density)) / 2
 *
 * The halving follows the paper's generalized-sampling argument (section
 * 4.3). The value is close to, but not the same as, the reference `sipp`
 * implementation.
 *
 * Artifacts: gradient (fx + fy, inverted if requested), deldensity, and the
 * per-bin delentropy magnitude.
 *
 * @throws GradientRangeException if J > MAX_GRADIENT
 * @throws InvalidArgumentException if the image is too small
 */
MethodResult Delentropy2D(const IntensityArray& grey, const DelentropyParams& params = {});

/**
 * @brief Delentropy of an arbitrary gradient field
 *
 * @param fx First gradient component, indexes density rows
 * @param fy Second gradient component, same shape as fx
 * @throws GradientRangeException if max(|fx|, |fy|) > MAX_GRADIENT
 */
DelentropyEstimate DelentropyFromGradients(const GradientArray& fx, const GradientArray& fy);

/**
 * @brief Gradient visualization
 *
 * Summary is the mean and standard deviation of the combined gradient; this
 * method does not compute an entropy.
 */
MethodResult Gradient2D(const IntensityArray& grey, const GradientParams& params = {});

/**
 * @brief Local entropy over a disk neighbourhood
 *
 * Entropy (base 2) of the values within dy^2 + dx^2 <= radius^2 of each
 * pixel, in-image neighbours only. Summary is the mean of the map.
 */
MethodResult RegionalDisk2D(const IntensityArray& grey, const RegionalDiskParams& params = {});

/**
 * @brief Local entropy over a square sliding window
 *
 * Window rows [max(0, i - r), min(H - 1, i + r)] and the same for columns,
 * r = (k - 1) / 2. Border windows are clamped symmetrically and shrink.
 * Summary is mean and population standard deviation of the map.
 */
MethodResult RegionalShannon2D(const IntensityArray& grey,
                               const RegionalShannonParams& params = {});

} // namespace Img::Entropy
