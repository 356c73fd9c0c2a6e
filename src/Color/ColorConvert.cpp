/**
 * @file ColorConvert.cpp
 * @brief Colour to greyscale conversion implementation
 */

#include <ImgEntropy/Color/ColorConvert.h>
#include <ImgEntropy/Core/Constants.h>
#include <ImgEntropy/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Img::Entropy::Color {

Image Rgb1ToGray(const Image& image, const std::string& method) {
    if (image.Empty()) return Image();

    std::string lowerMethod = method;
    std::transform(lowerMethod.begin(), lowerMethod.end(), lowerMethod.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    double rWeight, gWeight, bWeight;
    if (lowerMethod == "luminosity" || lowerMethod == "bt601") {
        rWeight = 0.299; gWeight = 0.587; bWeight = 0.114;
    } else if (lowerMethod == "bt709") {
        rWeight = 0.2126; gWeight = 0.7152; bWeight = 0.0722;
    } else if (lowerMethod == "average") {
        rWeight = gWeight = bWeight = 1.0 / 3.0;
    } else {
        throw InvalidArgumentException("Unknown grey conversion method: " + method);
    }

    const int32_t w = image.Width();
    const int32_t h = image.Height();
    const int32_t channels = image.Channels();
    Image result(w, h, ChannelType::Gray);

    for (int32_t y = 0; y < h; ++y) {
        const uint8_t* src = image.RowPtr(y);
        uint8_t* dst = result.RowPtr(y);

        for (int32_t x = 0; x < w; ++x) {
            const uint8_t* px = src + x * channels;
            if (channels < 3) {
                // Gray or gray + alpha
                dst[x] = px[0];
                continue;
            }
            double gray = rWeight * px[0] + gWeight * px[1] + bWeight * px[2];
            dst[x] = static_cast<uint8_t>(Clamp(static_cast<int32_t>(std::lround(gray)),
                                                0, MAX_INTENSITY));
        }
    }

    return result;
}

Image GrayToRgb(const Image& gray) {
    if (gray.Empty()) return Image();

    if (gray.GetChannelType() != ChannelType::Gray) {
        throw InvalidArgumentException("Input must be grayscale");
    }

    Image result(gray.Width(), gray.Height(), ChannelType::RGB);

    for (int32_t y = 0; y < gray.Height(); ++y) {
        const uint8_t* src = gray.RowPtr(y);
        uint8_t* dst = result.RowPtr(y);

        for (int32_t x = 0; x < gray.Width(); ++x) {
            uint8_t val = src[x];
            dst[x * 3 + 0] = val;
            dst[x * 3 + 1] = val;
            dst[x * 3 + 2] = val;
        }
    }

    return result;
}

IntensityArray ToIntensityArray(const Image& image) {
    Image gray = image.GetChannelType() == ChannelType::Gray ? image : Rgb1ToGray(image);

    IntensityArray result(gray.Height(), gray.Width(), 0);
    for (int32_t y = 0; y < gray.Height(); ++y) {
        const uint8_t* src = gray.RowPtr(y);
        int32_t* dst = result.RowPtr(y);
        for (int32_t x = 0; x < gray.Width(); ++x) {
            dst[x] = src[x];
        }
    }
    return result;
}

} // namespace Img::Entropy::Color
