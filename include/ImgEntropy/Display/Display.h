#pragma once

/**
 * @file Display.h
 * @brief Rendering of method results to image files
 *
 * Each panel (input image, greyscale image, every artifact) is written as a
 * PNG to an output directory and can be opened with the system viewer.
 *
 * Rendering hints:
 * - ForceColour: jet colour map instead of grey
 * - HasBar: jet colour map plus a vertical colour bar (maximum at the top)
 *
 * Values are normalized linearly from [min, max] of the array to [0, 255];
 * a constant array renders as mid grey.
 */

#include <ImgEntropy/Core/Array2D.h>
#include <ImgEntropy/Core/Image.h>
#include <ImgEntropy/Core/Types.h>
#include <ImgEntropy/Entropy/Methods.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Img::Entropy {

/**
 * @brief RGB colour
 */
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

// =============================================================================
// Rendering
// =============================================================================

/**
 * @brief Jet colour map, t in [0, 1] from blue over green to red
 */
Rgb JetColor(double t);

/**
 * @brief Render a real array to an 8-bit image
 *
 * @param data Values to render
 * @param colour true for the jet colour map (RGB), false for grey
 */
Image RenderArray(const RealArray& data, bool colour);

/**
 * @brief Append a vertical colour bar to the right of a panel
 *
 * @param panel Rendered panel (grey panels are expanded to RGB)
 * @param barWidth Bar width in pixels (0 = automatic)
 */
Image AttachColorBar(const Image& panel, int32_t barWidth = 0);

/**
 * @brief Render an artifact according to its hints
 */
Image RenderArtifact(const Artifact& artifact);

// =============================================================================
// Display
// =============================================================================

/**
 * @brief Set the output directory for displayed panels
 * @param path Directory path (created on first use)
 */
void SetDispOutputDir(const std::string& path);

/**
 * @brief Current output directory (with trailing separator)
 */
std::string GetDispOutputDir();

/**
 * @brief Write an image panel and optionally open it
 *
 * @param image Image to display
 * @param title Panel title (used as file name)
 * @param open Open the written file with the system viewer
 * @return Path of the written file
 * @throws IOException if the file cannot be written
 */
std::string DispImage(const Image& image, const std::string& title, bool open = true);

/**
 * @brief Write every panel of a method result
 *
 * Panels are "Input Image" (if colour is set), "Greyscale Image" (if grey is
 * set) and one per artifact, prefixed by title and the panel index.
 *
 * @param result Method output
 * @param title Common file name prefix
 * @param open Open written files with the system viewer
 * @return Paths of the written files, in panel order
 */
std::vector<std::string> DispResult(const MethodResult& result, const std::string& title,
                                    bool open = true);

/**
 * @brief Remove previously written panels from the output directory
 * @return Number of files removed
 */
int32_t CleanDispImages();

} // namespace Img::Entropy
