#pragma once

/**
 * @file ImageIO.h
 * @brief Image file decoding and encoding
 *
 * Reading: PNG, JPG/JPEG, BMP, TGA, GIF (first frame), PNM, PSD, HDR (tone
 * mapped) through stb_image; always decoded to 8 bits per channel.
 * Writing: PNG, JPG, BMP, TGA through stb_image_write.
 */

#include <ImgEntropy/Core/Image.h>

#include <cstdint>
#include <string>

namespace Img::Entropy::IO {

/**
 * @brief Output file formats
 */
enum class ImageFormat {
    Auto,       ///< Detect from extension
    PNG,
    JPEG,
    BMP,
    TGA
};

// =============================================================================
// Reading
// =============================================================================

/**
 * @brief Decode an image file
 *
 * Grey, grey+alpha, RGB and RGBA files keep their channel layout.
 *
 * @param filename Input file path
 * @return Decoded 8-bit image
 * @throws IOException if the file cannot be opened or decoded
 *
 * @code
 * Image img = ReadImage("barbara.png");
 * @endcode
 */
Image ReadImage(const std::string& filename);

// =============================================================================
// Writing
// =============================================================================

/**
 * @brief Encode an image to a file
 *
 * @param image Image to write
 * @param filename Output path
 * @param format Output format (Auto = from extension, PNG if unknown)
 * @param jpegQuality JPEG quality [1-100]
 * @return true on success
 */
bool WriteImage(const Image& image, const std::string& filename,
                ImageFormat format = ImageFormat::Auto, int32_t jpegQuality = 95);

// =============================================================================
// Format Utilities
// =============================================================================

/**
 * @brief Output format for a file name (case-insensitive extension)
 *
 * .jpg/.jpeg, .bmp and .tga map to their formats; anything else is PNG.
 */
ImageFormat GetFormatFromFilename(const std::string& filename);

} // namespace Img::Entropy::IO
