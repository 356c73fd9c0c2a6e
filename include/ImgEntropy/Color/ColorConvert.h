#pragma once

/**
 * @file ColorConvert.h
 * @brief Colour to greyscale conversion
 *
 * API Style: Image Func(const Image& in, params...)
 */

#include <ImgEntropy/Core/Array2D.h>
#include <ImgEntropy/Core/Image.h>

#include <string>

namespace Img::Entropy::Color {

/**
 * @brief Convert a colour image to a single-channel grey image
 *
 * Methods:
 * - "luminosity" / "bt601": 0.299 R + 0.587 G + 0.114 B (default)
 * - "bt709": 0.2126 R + 0.7152 G + 0.0722 B
 * - "average": (R + G + B) / 3
 *
 * Alpha channels are ignored. Grey input is returned as a copy (alpha
 * dropped).
 *
 * @param image Input image
 * @param method Weighting method
 * @return Grey image
 * @throws InvalidArgumentException for unknown methods
 */
Image Rgb1ToGray(const Image& image, const std::string& method = "luminosity");

/**
 * @brief Replicate a grey image into three channels
 */
Image GrayToRgb(const Image& gray);

/**
 * @brief Greyscale intensities of an image as a numeric array
 *
 * Colour input is converted with Rgb1ToGray() first.
 */
IntensityArray ToIntensityArray(const Image& image);

} // namespace Img::Entropy::Color
