/**
 * @file Methods.cpp
 * @brief Image entropy estimators implementation
 */

#include <ImgEntropy/Entropy/Methods.h>
#include <ImgEntropy/Core/Exception.h>
#include <ImgEntropy/Internal/EntropyMath.h>
#include <ImgEntropy/Internal/Gradient.h>
#include <ImgEntropy/Internal/Histogram.h>
#include <ImgEntropy/Internal/LocalEntropy.h>

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace Img::Entropy {

using Internal::GradientPair;

namespace {

std::vector<double> IntensityWeights(const IntensityArray& grey) {
    std::vector<double> weights;
    weights.reserve(grey.Size());
    for (int32_t v : grey) {
        if (v < 0) {
            throw InvalidArgumentException("Intensities must be non-negative, got " +
                                           std::to_string(v));
        }
        weights.push_back(static_cast<double>(v));
    }
    return weights;
}

// -sum(p * ln p) over p = counts[begin, end) / mass, zero bins skipped
double PartitionEntropy(const std::vector<int64_t>& hist, size_t begin, size_t end, double mass) {
    double entropy = 0.0;
    for (size_t i = begin; i < end; ++i) {
        if (hist[i] == 0) continue;
        double p = static_cast<double>(hist[i]) / mass;
        entropy -= p * Internal::MaskedLog(p);
    }
    return entropy;
}

EntropySummary MakeSummary(SummaryKind kind, double value) {
    EntropySummary summary;
    summary.kind = kind;
    summary.value = value;
    return summary;
}

} // anonymous namespace

// =============================================================================
// 1D Methods
// =============================================================================

KapurThreshold FindKapurThreshold(const IntensityArray& grey) {
    std::vector<int64_t> hist = Internal::GrayHistogram(grey);
    std::vector<double> cdf = Internal::CumulativeSum(hist);

    int32_t first = 0;
    int32_t last = 0;
    if (!Internal::NonzeroRange(hist, first, last)) {
        throw InvalidArgumentException("Kapur threshold needs intensities in [0, " +
                                       std::to_string(MAX_INTENSITY) + "]");
    }

    KapurThreshold best;
    for (int32_t i = first; i <= last; ++i) {
        double entropy = PartitionEntropy(hist, 0, static_cast<size_t>(i) + 1, cdf[i]);
        entropy += PartitionEntropy(hist, static_cast<size_t>(i) + 1, hist.size(),
                                    cdf[last] - cdf[i]);

        // Strict comparison: the first maximal threshold wins
        if (entropy > best.entropy) {
            best.entropy = entropy;
            best.threshold = i;
        }
    }
    return best;
}

MethodResult Kapur1D(const IntensityArray& grey, const Kapur1DParams& /*params*/) {
    KapurThreshold kapur = FindKapurThreshold(grey);

    RealArray thresholded(grey.Height(), grey.Width(), 0.0);
    const int32_t* src = grey.Data();
    double* dst = thresholded.Data();
    for (size_t i = 0; i < grey.Size(); ++i) {
        dst[i] = src[i] < kapur.threshold ? static_cast<double>(src[i]) : 0.0;
    }

    MethodResult result;
    result.artifacts.push_back({std::move(thresholded), "Kapur Threshold", {}});
    result.summary = MakeSummary(SummaryKind::Entropy, kapur.entropy);
    result.summary.threshold = kapur.threshold;
    return result;
}

MethodResult Scipy1D(const IntensityArray& grey, const Scipy1DParams& params) {
    MethodResult result;
    result.summary = MakeSummary(SummaryKind::Entropy,
                                 Internal::EntropyWithBase(IntensityWeights(grey), params.base));
    return result;
}

MethodResult Shannon1D(const IntensityArray& grey, const Shannon1DParams& /*params*/) {
    std::vector<double> probs = Internal::Normalize(IntensityWeights(grey));

    RealArray contribution(grey.Height(), grey.Width(), 0.0);
    double* dst = contribution.Data();
    for (size_t i = 0; i < probs.size(); ++i) {
        dst[i] = Internal::EntropyTerm(probs[i]);
    }
    double entropy = Internal::Sum(contribution);

    MethodResult result;
    result.artifacts.push_back({std::move(contribution), "Shannon Entropy", {}});
    result.summary = MakeSummary(SummaryKind::Entropy, entropy);
    return result;
}

// =============================================================================
// 2D Methods
// =============================================================================

DelentropyEstimate DelentropyFromGradients(const GradientArray& fx, const GradientArray& fy) {
    if (!fx.SameShape(fy)) {
        throw InvalidArgumentException("fx and fy must have the same shape");
    }

    DelentropyEstimate estimate;
    estimate.range = Internal::MaxAbsGradient(GradientPair{fx, fy});
    if (estimate.range > MAX_GRADIENT) {
        throw GradientRangeException(estimate.range, MAX_GRADIENT);
    }

    Array2D<int64_t> hist = Internal::JointGradientHistogram(fx, fy, estimate.range);
    estimate.density = Internal::HistogramDensity(hist);

    estimate.contribution = RealArray(estimate.density.Height(), estimate.density.Width(), 0.0);
    const double* d = estimate.density.Data();
    double* c = estimate.contribution.Data();
    double entropy = 0.0;
    for (size_t i = 0; i < estimate.density.Size(); ++i) {
        double term = Internal::EntropyTerm(d[i]);
        entropy += term;
        c[i] = term / 2.0;
    }

    // Papoulis generalized sampling halves the delentropy (paper, 4.3)
    estimate.entropy = entropy / 2.0;
    return estimate;
}

MethodResult Delentropy2D(const IntensityArray& grey, const DelentropyParams& params) {
    GradientPair grad;
    if (params.differenceMode == DifferenceMode::Central) {
        grad = Internal::CentralDifference(grey);
    } else {
        // Axis order: the vertical derivative comes first
        GradientPair numeric = Internal::NumericGradientInt(grey);
        grad = GradientPair{std::move(numeric.fy), std::move(numeric.fx)};
    }

    DelentropyEstimate estimate = DelentropyFromGradients(grad.fx, grad.fy);

    // fx + fy is only displayed; the entropy is invariant under the inversion
    RealArray gradImage(grad.fx.Height(), grad.fx.Width(), 0.0);
    for (int32_t r = 0; r < gradImage.Height(); ++r) {
        for (int32_t c = 0; c < gradImage.Width(); ++c) {
            int32_t sum = grad.fx(r, c) + grad.fy(r, c);
            gradImage(r, c) = static_cast<double>(params.invertOutput ? ~sum : sum);
        }
    }

    RealArray magnitude = estimate.contribution;
    for (int32_t r = 0; r < magnitude.Height(); ++r) {
        for (int32_t c = 0; c < magnitude.Width(); ++c) {
            magnitude(r, c) = std::abs(magnitude(r, c));
        }
    }

    MethodResult result;
    result.artifacts.push_back({std::move(gradImage), "Gradient", {}});
    result.artifacts.push_back({estimate.density, "Deldensity",
                                {RenderHint::HasBar, RenderHint::ForceColour}});
    result.artifacts.push_back({std::move(magnitude), "Delentropy", {RenderHint::HasBar}});
    result.summary = MakeSummary(SummaryKind::Entropy, estimate.entropy);
    return result;
}

MethodResult Gradient2D(const IntensityArray& grey, const GradientParams& params) {
    RealArray combined;

    if (params.gradientMode == GradientMode::Real) {
        Internal::RealGradient grad = Internal::NumericGradient(grey);
        combined = RealArray(grey.Height(), grey.Width(), 0.0);
        for (int32_t r = 0; r < grey.Height(); ++r) {
            for (int32_t c = 0; c < grey.Width(); ++c) {
                double sum = grad.gx(r, c) + grad.gy(r, c);
                if (params.combineMode == CombineMode::Concave) {
                    // Truncate toward zero, then signed complement
                    combined(r, c) = static_cast<double>(~static_cast<int64_t>(sum));
                } else {
                    combined(r, c) = sum;
                }
            }
        }
    } else {
        GradientPair grad = Internal::PrewittGradient(grey);
        combined = RealArray(grey.Height(), grey.Width(), 0.0);
        for (int32_t r = 0; r < grey.Height(); ++r) {
            for (int32_t c = 0; c < grey.Width(); ++c) {
                combined(r, c) = static_cast<double>(grad.fx(r, c) | grad.fy(r, c));
            }
        }
    }

    Internal::MeanStd stats = Internal::ComputeMeanStd(combined);

    MethodResult result;
    result.artifacts.push_back({std::move(combined), "Gradient", {}});
    result.summary = MakeSummary(SummaryKind::Gradient, stats.mean);
    result.summary.stdDev = stats.stdDev;
    return result;
}

MethodResult RegionalDisk2D(const IntensityArray& grey, const RegionalDiskParams& params) {
    if (params.radius < 1) {
        throw InvalidArgumentException("Disk radius must be >= 1, got " +
                                       std::to_string(params.radius));
    }

    RealArray entropyMap = Internal::LocalEntropy(
        grey, Internal::Footprint::Disk(params.radius, Internal::Footprint::ExtentLimit(grey)));
    Internal::MeanStd stats = Internal::ComputeMeanStd(entropyMap);

    MethodResult result;
    result.artifacts.push_back({std::move(entropyMap),
                                "Disk Entropy With Radius " + std::to_string(params.radius),
                                {RenderHint::HasBar}});
    result.summary = MakeSummary(SummaryKind::Entropy, stats.mean);
    return result;
}

MethodResult RegionalShannon2D(const IntensityArray& grey, const RegionalShannonParams& params) {
    RealArray entropyMap =
        Internal::LocalEntropy(
            grey, Internal::Footprint::Square(params.kernelSize,
                                              Internal::Footprint::ExtentLimit(grey)));
    Internal::MeanStd stats = Internal::ComputeMeanStd(entropyMap);

    const std::string k = std::to_string(params.kernelSize);

    MethodResult result;
    result.artifacts.push_back({std::move(entropyMap), "Entropy Map With " + k + "x" + k + " Kernel",
                                {RenderHint::HasBar, RenderHint::ForceColour}});
    result.summary = MakeSummary(SummaryKind::Entropy, stats.mean);
    result.summary.stdDev = stats.stdDev;
    return result;
}

} // namespace Img::Entropy
