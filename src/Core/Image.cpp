/**
 * @file Image.cpp
 * @brief Decoded 8-bit image implementation
 */

#include <ImgEntropy/Core/Image.h>
#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Core/Exception.h>

#include <string>

namespace Img::Entropy {

namespace {

void CheckDimensions(int32_t width, int32_t height) {
    if (width < 0 || height < 0) {
        throw InvalidArgumentException("Image dimensions must be non-negative");
    }
}

} // anonymous namespace

Image::Image(int32_t width, int32_t height, ChannelType channelType)
    : width_(width), height_(height), channelType_(channelType) {
    CheckDimensions(width, height);
    data_.assign(Stride() * static_cast<size_t>(height), 0);
}

Image::Image(int32_t width, int32_t height, ChannelType channelType,
             const uint8_t* pixels, size_t size)
    : width_(width), height_(height), channelType_(channelType) {
    CheckDimensions(width, height);
    size_t expected = Stride() * static_cast<size_t>(height);
    if (size != expected) {
        throw InvalidArgumentException("Image buffer holds " + std::to_string(size) +
                                       " bytes, expected " + std::to_string(expected));
    }
    data_.assign(pixels, pixels + size);
}

} // namespace Img::Entropy
