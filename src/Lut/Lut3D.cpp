/**
 * @file Lut3D.cpp
 * @brief 3D LUT container and application
 */

#include <LookForge/Lut/Lut3D.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Core/Validate.h>
#include <LookForge/Internal/Interpolate.h>
#include <LookForge/Platform/Logger.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace Look::Forge::Lut {

// =============================================================================
// Lut3D
// =============================================================================

Lut3D::Lut3D(int32_t size) : size_(size) {
    Validate::RequireMin(size, LUT_MIN_SIZE, "size", "Lut3D");
    data_.assign(static_cast<size_t>(size) * size * size * 3, 0.0);
}

Lut3D Lut3D::Identity(int32_t size) {
    Lut3D lut(size);
    const double scale = 1.0 / (size - 1);
    for (int32_t b = 0; b < size; ++b) {
        for (int32_t g = 0; g < size; ++g) {
            for (int32_t r = 0; r < size; ++r) {
                lut.Set(r, g, b, r * scale, g * scale, b * scale);
            }
        }
    }
    return lut;
}

double Lut3D::MaxDifference(const Lut3D& other) const {
    if (other.size_ != size_) {
        throw InvalidArgumentException("Lut3D::MaxDifference: size mismatch (" +
                                       std::to_string(size_) + " vs " +
                                       std::to_string(other.size_) + ")");
    }
    double maxDiff = 0.0;
    for (size_t i = 0; i < data_.size(); ++i) {
        maxDiff = std::max(maxDiff, std::abs(data_[i] - other.data_[i]));
    }
    return maxDiff;
}

// =============================================================================
// Interpolation mode
// =============================================================================

LutInterpolation ParseLutInterpolation(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "auto") return LutInterpolation::Auto;
    if (lower == "trilinear" || lower == "linear") return LutInterpolation::Trilinear;
    if (lower == "tricubic" || lower == "cubic") return LutInterpolation::Tricubic;

    throw ConfigurationException("unknown LUT interpolation '" + name +
                                 "' (valid: auto, trilinear, tricubic)");
}

// =============================================================================
// Identity lattice
// =============================================================================

LImage CreateIdentityLattice(int32_t size) {
    Validate::RequireMin(size, LUT_MIN_SIZE, "size", "CreateIdentityLattice");

    const int32_t n = size;
    LImage lattice(n, n * n, PixelType::Float32, ChannelType::RGB);
    const double scale = 1.0 / (n - 1);

    for (int32_t y = 0; y < n * n; ++y) {
        float* row = static_cast<float*>(lattice.RowPtr(y));
        for (int32_t x = 0; x < n; ++x) {
            int64_t i = static_cast<int64_t>(y) * n + x;
            row[x * 3 + 0] = static_cast<float>((i % n) * scale);
            row[x * 3 + 1] = static_cast<float>(((i / n) % n) * scale);
            row[x * 3 + 2] = static_cast<float>((i / (static_cast<int64_t>(n) * n)) * scale);
        }
    }

    return lattice;
}

// =============================================================================
// Apply
// =============================================================================

LImage ApplyLut(const LImage& image, const Lut3D& lut, LutInterpolation interpolation) {
    Validate::RequireImageNonEmpty(image, "ApplyLut");
    if (lut.Empty()) {
        throw InvalidArgumentException("ApplyLut: LUT is empty");
    }

    const int32_t size = lut.Size();
    bool cubic = false;
    switch (interpolation) {
        case LutInterpolation::Auto:
            cubic = size >= LUT_TRICUBIC_MIN_SIZE;
            break;
        case LutInterpolation::Trilinear:
            cubic = false;
            break;
        case LutInterpolation::Tricubic:
            Validate::RequireMin(size, LUT_TRICUBIC_MIN_SIZE, "lut size", "ApplyLut");
            cubic = true;
            break;
    }
    Log::Debug("ApplyLut: size {}, {}", size, cubic ? "tricubic" : "trilinear");

    LImage rgb = image.ToRgb();
    const bool isFloat = rgb.Type() == PixelType::Float32;
    const int32_t width = rgb.Width();
    const int32_t height = rgb.Height();
    const double* grid = lut.Data().data();

    LImage out(width, height, PixelType::UInt8, ChannelType::RGB);
    for (int32_t y = 0; y < height; ++y) {
        const void* src = rgb.RowPtr(y);
        uint8_t* dst = static_cast<uint8_t*>(out.RowPtr(y));
        for (int32_t x = 0; x < width; ++x) {
            double in[3];
            for (int c = 0; c < 3; ++c) {
                in[c] = isFloat ? static_cast<const float*>(src)[x * 3 + c]
                                : static_cast<const uint8_t*>(src)[x * 3 + c] / 255.0;
            }

            double res[3];
            if (cubic) {
                Internal::SampleTricubic(grid, size, in[0], in[1], in[2], res);
            } else {
                Internal::SampleTrilinear(grid, size, in[0], in[1], in[2], res);
            }

            for (int c = 0; c < 3; ++c) {
                dst[x * 3 + c] = static_cast<uint8_t>(std::lround(std::clamp(res[c], 0.0, 1.0) * 255.0));
            }
        }
    }

    return out;
}

} // namespace Look::Forge::Lut
