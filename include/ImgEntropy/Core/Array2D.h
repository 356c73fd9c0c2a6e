#pragma once

/**
 * @file Array2D.h
 * @brief Row-major owning 2D array used for every numeric image in ImgEntropy
 *
 * Shape is (height, width), indexed as (row, col). Arrays own their storage;
 * copies are deep. Methods receive arrays by const reference and never
 * modify them in place.
 */

#include <ImgEntropy/Core/Exception.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Img::Entropy {

template<typename T>
class Array2D {
public:
    using value_type = T;

    /// Empty array (0 x 0)
    Array2D() = default;

    /**
     * @brief Create an array filled with a value
     * @param height Number of rows
     * @param width Number of columns
     * @param value Initial value of every element
     */
    Array2D(int32_t height, int32_t width, T value = T())
        : height_(height), width_(width) {
        if (height < 0 || width < 0) {
            throw InvalidArgumentException("Array2D dimensions must be non-negative, got " +
                                           std::to_string(height) + "x" + std::to_string(width));
        }
        data_.assign(static_cast<size_t>(height) * static_cast<size_t>(width), value);
    }

    /**
     * @brief Create an array from row-major values
     * @throws InvalidArgumentException if values.size() != height * width
     */
    Array2D(int32_t height, int32_t width, std::vector<T> values)
        : height_(height), width_(width), data_(std::move(values)) {
        if (height < 0 || width < 0 ||
            data_.size() != static_cast<size_t>(height) * static_cast<size_t>(width)) {
            throw InvalidArgumentException("Array2D value count does not match " +
                                           std::to_string(height) + "x" + std::to_string(width));
        }
    }

    // =========================================================================
    // Shape
    // =========================================================================

    int32_t Height() const { return height_; }
    int32_t Width() const { return width_; }
    size_t Size() const { return data_.size(); }
    bool Empty() const { return data_.empty(); }

    bool SameShape(const Array2D& other) const {
        return height_ == other.height_ && width_ == other.width_;
    }

    // =========================================================================
    // Element Access
    // =========================================================================

    T& operator()(int32_t row, int32_t col) {
        return data_[static_cast<size_t>(row) * width_ + col];
    }

    const T& operator()(int32_t row, int32_t col) const {
        return data_[static_cast<size_t>(row) * width_ + col];
    }

    /// Bounds-checked access
    const T& At(int32_t row, int32_t col) const {
        if (row < 0 || row >= height_ || col < 0 || col >= width_) {
            throw InvalidArgumentException("Array2D index (" + std::to_string(row) + ", " +
                                           std::to_string(col) + ") out of range");
        }
        return (*this)(row, col);
    }

    T* Data() { return data_.data(); }
    const T* Data() const { return data_.data(); }

    T* RowPtr(int32_t row) { return data_.data() + static_cast<size_t>(row) * width_; }
    const T* RowPtr(int32_t row) const {
        return data_.data() + static_cast<size_t>(row) * width_;
    }

    const std::vector<T>& Values() const { return data_; }

    typename std::vector<T>::const_iterator begin() const { return data_.begin(); }
    typename std::vector<T>::const_iterator end() const { return data_.end(); }

    // =========================================================================
    // Operations
    // =========================================================================

    void Fill(T value) { std::fill(data_.begin(), data_.end(), value); }

    Array2D Clone() const { return *this; }

    /**
     * @brief Copy of the sub-array rows [row0, row0 + h), cols [col0, col0 + w)
     */
    Array2D Crop(int32_t row0, int32_t col0, int32_t h, int32_t w) const {
        if (row0 < 0 || col0 < 0 || h < 0 || w < 0 ||
            row0 + h > height_ || col0 + w > width_) {
            throw InvalidArgumentException("Array2D crop out of range");
        }
        Array2D result(h, w);
        for (int32_t r = 0; r < h; ++r) {
            std::copy(RowPtr(row0 + r) + col0, RowPtr(row0 + r) + col0 + w, result.RowPtr(r));
        }
        return result;
    }

    /**
     * @brief Element-wise conversion to another value type
     */
    template<typename U>
    Array2D<U> Cast() const {
        Array2D<U> result(height_, width_);
        U* dst = result.Data();
        for (size_t i = 0; i < data_.size(); ++i) {
            dst[i] = static_cast<U>(data_[i]);
        }
        return result;
    }

    bool operator==(const Array2D& other) const {
        return SameShape(other) && data_ == other.data_;
    }

    bool operator!=(const Array2D& other) const { return !(*this == other); }

private:
    int32_t height_ = 0;
    int32_t width_ = 0;
    std::vector<T> data_;
};

/// Greyscale intensities, conventionally 0-255
using IntensityArray = Array2D<int32_t>;

/// Signed finite differences
using GradientArray = Array2D<int32_t>;

/// Entropy maps, densities, display data
using RealArray = Array2D<double>;

} // namespace Img::Entropy
