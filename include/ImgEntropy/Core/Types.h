#pragma once

/**
 * @file Types.h
 * @brief Shared enumerations and display-contract types
 */

#include <ImgEntropy/Core/Array2D.h>

#include <cstdint>
#include <set>
#include <string>

namespace Img::Entropy {

// =============================================================================
// Pixel Layout
// =============================================================================

/**
 * @brief Channel layout of a decoded 8-bit image
 */
enum class ChannelType {
    Gray,       ///< 1 channel
    GrayAlpha,  ///< 2 channels
    RGB,        ///< 3 channels
    RGBA        ///< 4 channels
};

/**
 * @brief Number of interleaved channels of a layout
 */
inline int32_t ChannelCount(ChannelType type) {
    switch (type) {
        case ChannelType::Gray: return 1;
        case ChannelType::GrayAlpha: return 2;
        case ChannelType::RGB: return 3;
        case ChannelType::RGBA: return 4;
    }
    return 1;
}

// =============================================================================
// Display Contract
// =============================================================================

/**
 * @brief Presentation directive attached to a derived array
 */
enum class RenderHint {
    HasBar,         ///< Draw a colour bar next to the array
    ForceColour     ///< Use a colour map even though the data is scalar
};

using RenderHints = std::set<RenderHint>;

/**
 * @brief A labelled derived array handed to the presentation layer
 *
 * Carries no computation state; it is the output contract of every method.
 */
struct Artifact {
    RealArray data;
    std::string label;
    RenderHints hints;

    bool HasHint(RenderHint hint) const { return hints.count(hint) != 0; }
};

} // namespace Img::Entropy
