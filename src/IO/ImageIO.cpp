/**
 * @file ImageIO.cpp
 * @brief Image file decoding and encoding implementation
 */

#include <ImgEntropy/IO/ImageIO.h>
#include <ImgEntropy/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <memory>

#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace Img::Entropy::IO {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string GetExtension(const std::string& filename) {
    auto pos = filename.rfind('.');
    if (pos == std::string::npos) return "";
    return ToLower(filename.substr(pos));
}

ChannelType ChannelTypeFromCount(int channels) {
    switch (channels) {
        case 1: return ChannelType::Gray;
        case 2: return ChannelType::GrayAlpha;
        case 3: return ChannelType::RGB;
        case 4: return ChannelType::RGBA;
        default:
            throw UnsupportedException("Images with " + std::to_string(channels) +
                                       " channels are not supported");
    }
}

struct StbiDeleter {
    void operator()(stbi_uc* data) const { stbi_image_free(data); }
};

} // anonymous namespace

// =============================================================================
// Format Utilities
// =============================================================================

ImageFormat GetFormatFromFilename(const std::string& filename) {
    std::string ext = GetExtension(filename);

    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::JPEG;
    if (ext == ".bmp") return ImageFormat::BMP;
    if (ext == ".tga") return ImageFormat::TGA;

    return ImageFormat::PNG;
}

// =============================================================================
// Reading
// =============================================================================

Image ReadImage(const std::string& filename) {
    int w = 0;
    int h = 0;
    int channels = 0;
    std::unique_ptr<stbi_uc, StbiDeleter> pixels(stbi_load(filename.c_str(), &w, &h, &channels, 0));
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        throw IOException("Failed to read image: " + filename + " - " +
                          (reason != nullptr ? reason : "unknown error"));
    }

    size_t size = static_cast<size_t>(w) * static_cast<size_t>(h) * static_cast<size_t>(channels);
    return Image(w, h, ChannelTypeFromCount(channels), pixels.get(), size);
}

// =============================================================================
// Writing
// =============================================================================

bool WriteImage(const Image& image, const std::string& filename,
                ImageFormat format, int32_t jpegQuality) {
    if (image.Empty()) return false;

    if (format == ImageFormat::Auto) {
        format = GetFormatFromFilename(filename);
    }

    const int w = image.Width();
    const int h = image.Height();
    const int channels = image.Channels();
    const int stride = static_cast<int>(image.Stride());

    switch (format) {
        case ImageFormat::JPEG:
            return stbi_write_jpg(filename.c_str(), w, h, channels, image.Data(),
                                  std::clamp(jpegQuality, 1, 100)) != 0;
        case ImageFormat::BMP:
            return stbi_write_bmp(filename.c_str(), w, h, channels, image.Data()) != 0;
        case ImageFormat::TGA:
            return stbi_write_tga(filename.c_str(), w, h, channels, image.Data()) != 0;
        default:
            return stbi_write_png(filename.c_str(), w, h, channels, image.Data(), stride) != 0;
    }
}

} // namespace Img::Entropy::IO
