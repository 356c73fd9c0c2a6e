/**
 * @file LocalEntropy.cpp
 * @brief Neighbourhood entropy filter implementation
 */

#include <ImgEntropy/Internal/LocalEntropy.h>
#include <ImgEntropy/Internal/EntropyMath.h>
#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Core/Exception.h>

#include <algorithm>
#include <string>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Img::Entropy::Internal {

// ============================================================================
// Footprint
// ============================================================================

namespace {

void CheckMaxExtent(int32_t maxExtent) {
    if (maxExtent < 0) {
        throw InvalidArgumentException("Footprint extent limit must be non-negative, got " +
                                       std::to_string(maxExtent));
    }
}

} // anonymous namespace

Footprint Footprint::Square(int32_t kernelSize, int32_t maxExtent) {
    if (kernelSize < MIN_KERNEL_SIZE || kernelSize % 2 != 1) {
        throw InvalidArgumentException(std::to_string(kernelSize) +
                                       " is not a valid kernel size (odd, >= " +
                                       std::to_string(MIN_KERNEL_SIZE) + ")");
    }
    CheckMaxExtent(maxExtent);

    const int32_t extent = std::min((kernelSize - 1) / 2, maxExtent);
    const size_t side = 2 * static_cast<size_t>(extent) + 1;
    std::vector<Offset> offsets;
    offsets.reserve(side * side);
    for (int32_t dy = -extent; dy <= extent; ++dy) {
        for (int32_t dx = -extent; dx <= extent; ++dx) {
            offsets.push_back({dy, dx});
        }
    }
    return Footprint(std::move(offsets), extent);
}

Footprint Footprint::Disk(int32_t radius, int32_t maxExtent) {
    if (radius < 0) {
        throw InvalidArgumentException("Disk radius must be non-negative, got " +
                                       std::to_string(radius));
    }
    CheckMaxExtent(maxExtent);

    const int32_t extent = std::min(radius, maxExtent);
    const int64_t limit = Img::Entropy::Square<int64_t>(radius);
    std::vector<Offset> offsets;
    for (int32_t dy = -extent; dy <= extent; ++dy) {
        for (int32_t dx = -extent; dx <= extent; ++dx) {
            if (Img::Entropy::Square<int64_t>(dy) + Img::Entropy::Square<int64_t>(dx) <= limit) {
                offsets.push_back({dy, dx});
            }
        }
    }
    return Footprint(std::move(offsets), extent);
}

int32_t Footprint::ExtentLimit(const IntensityArray& image) {
    return std::max(std::max(image.Height(), image.Width()) - 1, 0);
}

// ============================================================================
// Local Entropy
// ============================================================================

RealArray LocalEntropy(const IntensityArray& image, const Footprint& footprint) {
    const int32_t h = image.Height();
    const int32_t w = image.Width();
    RealArray result(h, w, 0.0);

    const auto& offsets = footprint.Offsets();

#ifdef _OPENMP
    #pragma omp parallel
    {
#endif
        std::vector<int32_t> samples;
        samples.reserve(offsets.size());

#ifdef _OPENMP
        #pragma omp for schedule(dynamic)
#endif
        for (int32_t y = 0; y < h; ++y) {
            double* dstRow = result.RowPtr(y);
            for (int32_t x = 0; x < w; ++x) {
                samples.clear();
                for (const auto& o : offsets) {
                    int32_t sy = y + o.dy;
                    int32_t sx = x + o.dx;
                    if (sy >= 0 && sy < h && sx >= 0 && sx < w) {
                        samples.push_back(image(sy, sx));
                    }
                }
                dstRow[x] = EntropyOfSamples(samples);
            }
        }
#ifdef _OPENMP
    }
#endif

    return result;
}

} // namespace Img::Entropy::Internal
