#pragma once

/**
 * @file EntropyMath.h
 * @brief Probability and logarithm helpers shared by every entropy method
 *
 * Provides:
 * - Masked logarithms (0 maps to 0, so 0 * log(0) contributes nothing)
 * - Shannon entropy from counts or from raw samples
 * - Normalization of weights into a probability vector
 * - Mean / standard deviation summaries
 *
 * Every method goes through these helpers so the zero-probability policy
 * is identical everywhere.
 */

#include <ImgEntropy/Core/Array2D.h>

#include <cstdint>
#include <vector>

namespace Img::Entropy::Internal {

// ============================================================================
// Masked Logarithms
// ============================================================================

/**
 * @brief log2(x) for x > 0, 0 for x == 0
 * @throws InvalidArgumentException for negative x
 */
double MaskedLog2(double x);

/**
 * @brief Natural logarithm for x > 0, 0 for x == 0
 */
double MaskedLog(double x);

/**
 * @brief log_base(x) for x > 0, 0 for x == 0
 * @param base Logarithm base, must be > 0 and != 1
 */
double MaskedLogBase(double x, double base);

/**
 * @brief Entropy contribution -p * log2(p), 0 for p == 0
 */
inline double EntropyTerm(double p) {
    return -p * MaskedLog2(p);
}

// ============================================================================
// Probability Distributions
// ============================================================================

/**
 * @brief Divide weights by their sum
 *
 * An all-zero (or empty) input yields all zeros; no division by zero.
 */
std::vector<double> Normalize(const std::vector<double>& weights);

/**
 * @brief Shannon entropy (base 2) of a histogram of counts
 *
 * Zero bins are skipped. A histogram with a single non-zero bin, or with
 * no samples at all, has entropy 0.
 *
 * @param counts Occurrence count per outcome
 * @return Entropy in bits
 */
double EntropyFromCounts(const std::vector<int64_t>& counts);

/**
 * @brief Shannon entropy (base 2) of the value distribution of samples
 *
 * Sorts the samples in place and counts runs of equal values; terms are
 * summed in ascending value order so the result is deterministic.
 *
 * @param samples Sample values (reordered)
 * @return Entropy in bits, 0 for empty or constant input
 */
double EntropyOfSamples(std::vector<int32_t>& samples);

/**
 * @brief Shannon entropy with configurable logarithm base
 *
 * Weights are normalized by their sum first. Equivalent to
 * -sum(p * log_base(p)) over non-zero p.
 */
double EntropyWithBase(const std::vector<double>& weights, double base);

// ============================================================================
// Summary Statistics
// ============================================================================

/**
 * @brief Arithmetic mean and population standard deviation
 */
struct MeanStd {
    double mean = 0.0;
    double stdDev = 0.0;
};

/**
 * @brief Mean and population standard deviation of all elements
 */
MeanStd ComputeMeanStd(const RealArray& values);

/**
 * @brief Sum of all elements
 */
double Sum(const RealArray& values);

} // namespace Img::Entropy::Internal
