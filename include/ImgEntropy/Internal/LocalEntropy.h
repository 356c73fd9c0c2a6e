#pragma once

/**
 * @file LocalEntropy.h
 * @brief Neighbourhood (sliding-window) entropy filter
 *
 * For each pixel, the Shannon entropy (base 2) of the value distribution
 * inside a footprint centred on it. Footprint cells that fall outside the
 * image are dropped, so border neighbourhoods are smaller; there is no
 * padding.
 *
 * Each output cell depends only on its own neighbourhood, so rows are
 * processed in parallel when OpenMP is available; the result is identical
 * to the sequential one.
 */

#include <ImgEntropy/Core/Array2D.h>

#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace Img::Entropy::Internal {

/**
 * @brief Neighbourhood shape as a list of (row, col) offsets
 */
class Footprint {
public:
    struct Offset {
        int32_t dy;
        int32_t dx;
    };

    /**
     * @brief k x k square centred on the pixel
     * @param kernelSize Odd size >= 3
     * @param maxExtent Offsets beyond this |dy| or |dx| are left out
     * @throws InvalidArgumentException for even or too small sizes
     */
    static Footprint Square(int32_t kernelSize,
                            int32_t maxExtent = std::numeric_limits<int32_t>::max());

    /**
     * @brief Disk of all offsets with dy^2 + dx^2 <= radius^2
     * @param radius Radius >= 0 (0 is the single centre pixel)
     * @param maxExtent Offsets beyond this |dy| or |dx| are left out
     */
    static Footprint Disk(int32_t radius,
                          int32_t maxExtent = std::numeric_limits<int32_t>::max());

    /**
     * @brief Largest offset that can still land inside image
     *
     * Passing it as maxExtent leaves every in-bounds neighbourhood unchanged
     * while keeping the offset list no larger than the image allows.
     */
    static int32_t ExtentLimit(const IntensityArray& image);

    const std::vector<Offset>& Offsets() const { return offsets_; }
    size_t Size() const { return offsets_.size(); }

    /// Largest |dy| or |dx|
    int32_t Extent() const { return extent_; }

private:
    Footprint(std::vector<Offset> offsets, int32_t extent)
        : offsets_(std::move(offsets)), extent_(extent) {}

    std::vector<Offset> offsets_;
    int32_t extent_ = 0;
};

/**
 * @brief Local entropy map
 *
 * @param image Intensity array (read-only)
 * @param footprint Neighbourhood shape
 * @return Entropy in bits per pixel, same shape as image
 */
RealArray LocalEntropy(const IntensityArray& image, const Footprint& footprint);

} // namespace Img::Entropy::Internal
