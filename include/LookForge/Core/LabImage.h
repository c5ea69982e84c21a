#pragma once

/**
 * @file LabImage.h
 * @brief Double-precision three-channel buffer for perceptual-space math
 *
 * Holds CIE L*a*b* values (L in [0, 100], a/b in [-128, 127]) interleaved
 * per pixel. All transfer arithmetic runs on this type so that rounding to
 * 8 bits happens only once, at the end of the pipeline.
 */

#include <LookForge/Core/Exception.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Look::Forge {

class LabImage {
public:
    LabImage() = default;

    LabImage(int32_t width, int32_t height)
        : width_(width), height_(height)
    {
        if (width <= 0 || height <= 0) {
            throw InvalidArgumentException("LabImage dimensions must be positive");
        }
        data_.assign(static_cast<size_t>(width) * height * 3, 0.0);
    }

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    size_t PixelCount() const { return static_cast<size_t>(width_) * height_; }
    bool Empty() const { return data_.empty(); }

    /// Value of channel c at flat pixel index i
    double At(size_t i, int c) const { return data_[i * 3 + c]; }
    double& At(size_t i, int c) { return data_[i * 3 + c]; }

    /// Value of channel c at (x, y)
    double At(int32_t x, int32_t y, int c) const {
        return data_[(static_cast<size_t>(y) * width_ + x) * 3 + c];
    }
    double& At(int32_t x, int32_t y, int c) {
        return data_[(static_cast<size_t>(y) * width_ + x) * 3 + c];
    }

    /// Copy of one channel as a flat vector
    std::vector<double> Channel(int c) const {
        std::vector<double> out(PixelCount());
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = data_[i * 3 + c];
        }
        return out;
    }

    const std::vector<double>& Values() const { return data_; }
    std::vector<double>& Values() { return data_; }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<double> data_;
};

} // namespace Look::Forge
