/**
 * @file EntropyMath.cpp
 * @brief Masked logarithms and entropy estimation
 */

#include <ImgEntropy/Internal/EntropyMath.h>
#include <ImgEntropy/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace Img::Entropy::Internal {

// ============================================================================
// Masked Logarithms
// ============================================================================

double MaskedLog2(double x) {
    if (x < 0.0) {
        throw InvalidArgumentException("MaskedLog2 of negative value " + std::to_string(x));
    }
    return x == 0.0 ? 0.0 : std::log2(x);
}

double MaskedLog(double x) {
    if (x < 0.0) {
        throw InvalidArgumentException("MaskedLog of negative value " + std::to_string(x));
    }
    return x == 0.0 ? 0.0 : std::log(x);
}

double MaskedLogBase(double x, double base) {
    if (base <= 0.0 || base == 1.0) {
        throw InvalidArgumentException("Logarithm base must be > 0 and != 1, got " +
                                       std::to_string(base));
    }
    return MaskedLog(x) / std::log(base);
}

// ============================================================================
// Probability Distributions
// ============================================================================

std::vector<double> Normalize(const std::vector<double>& weights) {
    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    std::vector<double> probs(weights.size(), 0.0);
    if (total <= 0.0) {
        return probs;
    }
    for (size_t i = 0; i < weights.size(); ++i) {
        probs[i] = weights[i] / total;
    }
    return probs;
}

double EntropyFromCounts(const std::vector<int64_t>& counts) {
    int64_t total = 0;
    for (int64_t c : counts) {
        total += c;
    }
    if (total == 0) return 0.0;

    double entropy = 0.0;
    for (int64_t c : counts) {
        if (c > 0) {
            entropy += EntropyTerm(static_cast<double>(c) / static_cast<double>(total));
        }
    }
    return entropy;
}

double EntropyOfSamples(std::vector<int32_t>& samples) {
    if (samples.empty()) return 0.0;

    std::sort(samples.begin(), samples.end());

    const double size = static_cast<double>(samples.size());
    double entropy = 0.0;
    size_t runStart = 0;
    for (size_t i = 1; i <= samples.size(); ++i) {
        if (i == samples.size() || samples[i] != samples[runStart]) {
            entropy += EntropyTerm(static_cast<double>(i - runStart) / size);
            runStart = i;
        }
    }
    return entropy;
}

double EntropyWithBase(const std::vector<double>& weights, double base) {
    for (double w : weights) {
        if (w < 0.0) {
            throw InvalidArgumentException("Entropy weights must be non-negative");
        }
    }
    std::vector<double> probs = Normalize(weights);

    double entropy = 0.0;
    for (double p : probs) {
        entropy -= p * MaskedLogBase(p, base);
    }
    return entropy;
}

// ============================================================================
// Summary Statistics
// ============================================================================

double Sum(const RealArray& values) {
    return std::accumulate(values.begin(), values.end(), 0.0);
}

MeanStd ComputeMeanStd(const RealArray& values) {
    MeanStd result;
    if (values.Empty()) return result;

    const double n = static_cast<double>(values.Size());
    result.mean = Sum(values) / n;

    double sqSum = 0.0;
    for (double v : values) {
        double d = v - result.mean;
        sqSum += d * d;
    }
    result.stdDev = std::sqrt(sqSum / n);
    return result;
}

} // namespace Img::Entropy::Internal
