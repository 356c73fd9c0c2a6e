#pragma once

/**
 * @file Image.h
 * @brief Decoded 8-bit image with interleaved channels
 *
 * Holds the colour array as it comes out of the decoder. Numeric work is
 * done on Array2D; Image only travels to the display layer.
 */

#include <ImgEntropy/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Img::Entropy {

class Image {
public:
    /// Empty image
    Image() = default;

    /**
     * @brief Allocate a zero-filled image
     * @param width Width in pixels
     * @param height Height in pixels
     * @param channelType Channel layout
     */
    Image(int32_t width, int32_t height, ChannelType channelType = ChannelType::Gray);

    /**
     * @brief Wrap a copy of interleaved pixel data
     * @throws InvalidArgumentException if the buffer size does not match
     */
    Image(int32_t width, int32_t height, ChannelType channelType,
          const uint8_t* pixels, size_t size);

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    int32_t Channels() const { return ChannelCount(channelType_); }
    ChannelType GetChannelType() const { return channelType_; }
    bool Empty() const { return data_.empty(); }

    /// Bytes per row (no padding)
    size_t Stride() const { return static_cast<size_t>(width_) * Channels(); }

    uint8_t* Data() { return data_.data(); }
    const uint8_t* Data() const { return data_.data(); }

    uint8_t* RowPtr(int32_t row) { return data_.data() + row * Stride(); }
    const uint8_t* RowPtr(int32_t row) const { return data_.data() + row * Stride(); }

    Image Clone() const { return *this; }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    ChannelType channelType_ = ChannelType::Gray;
    std::vector<uint8_t> data_;
};

} // namespace Img::Entropy
