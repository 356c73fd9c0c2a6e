#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants and small helpers for ImgEntropy
 */

#include <cstdint>

namespace Img::Entropy {

// =============================================================================
// Dynamic Range
// =============================================================================

/// Largest representable 8-bit sample value
constexpr int32_t MAX_INTENSITY = 255;

/// Number of gray levels of an 8-bit image
constexpr int32_t GRAY_LEVELS = 256;

/// Bound on |fx| and |fy| assumed by the joint gradient histogram
constexpr int32_t MAX_GRADIENT = 255;

/// Bits of the assumed dynamic range, used for the entropy ratio
constexpr double ENTROPY_RATIO_BITS = 8.0;

// =============================================================================
// Default Parameters
// =============================================================================

/// Default window size for sliding-window entropy
constexpr int32_t DEFAULT_KERNEL_SIZE = 11;

/// Smallest valid window size
constexpr int32_t MIN_KERNEL_SIZE = 3;

/// Default disk radius for the disk-neighbourhood entropy
constexpr int32_t DEFAULT_DISK_RADIUS = 5;

/// Default logarithm base of the 1D base-general entropy
constexpr double DEFAULT_LOG_BASE = 8.0;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Clamp value to range
 */
template<typename T>
inline T Clamp(T value, T minVal, T maxVal) {
    return value < minVal ? minVal : (value > maxVal ? maxVal : value);
}

/**
 * @brief Square of a value
 */
template<typename T>
inline T Square(T x) {
    return x * x;
}

} // namespace Img::Entropy
