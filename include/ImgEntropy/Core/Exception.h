#pragma once

/**
 * @file Exception.h
 * @brief Exception hierarchy for ImgEntropy
 *
 * All library errors derive from Img::Entropy::Exception, which itself is a
 * std::runtime_error, so callers can catch at whichever level they need.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Img::Entropy {

/**
 * @brief Base class of all ImgEntropy errors
 */
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid parameter, method name, or image shape
 */
class InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief File could not be read or written
 */
class IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Input layout the operation does not handle
 */
class UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

/**
 * @brief Gradient magnitude exceeds the 8-bit bound of the joint histogram
 *
 * Raised when max(|fx|, |fy|) > MAX_GRADIENT. The image's dynamic range is
 * incompatible with one-bin-per-integer binning; not recoverable.
 */
class GradientRangeException : public Exception {
public:
    GradientRangeException(int32_t range, int32_t limit)
        : Exception("J must be in range [-" + std::to_string(limit) + ", " +
                    std::to_string(limit) + "], got " + std::to_string(range)),
          range_(range), limit_(limit) {}

    /// Observed max(|fx|, |fy|)
    int32_t Range() const { return range_; }

    /// Allowed bound
    int32_t Limit() const { return limit_; }

private:
    int32_t range_;
    int32_t limit_;
};

} // namespace Img::Entropy
