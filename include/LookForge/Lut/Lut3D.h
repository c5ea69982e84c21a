#pragma once

/**
 * @file Lut3D.h
 * @brief 3D color lookup table and its application to images
 *
 * A LUT of size N maps each lattice node (r, g, b), indices in [0, N-1] and
 * coordinates idx / (N-1), to an output RGB triple in [0, 1].
 */

#include <LookForge/Core/Export.h>
#include <LookForge/Core/LImage.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Look::Forge::Lut {

/// Smallest lattice that can be interpolated
constexpr int32_t LUT_MIN_SIZE = 2;

/// Smallest lattice that is sampled tricubically in Auto mode
constexpr int32_t LUT_TRICUBIC_MIN_SIZE = 4;

/**
 * @brief N x N x N x 3 table of doubles, R index fastest in memory
 */
class LOOKFORGE_API Lut3D {
public:
    /// Empty LUT
    Lut3D() = default;

    /**
     * @brief Zero-filled LUT of the given size
     * @throws InvalidArgumentException if size < 2
     */
    explicit Lut3D(int32_t size);

    /// Identity mapping: node (r, g, b) -> (r, g, b) / (N-1)
    static Lut3D Identity(int32_t size);

    int32_t Size() const { return size_; }
    bool Empty() const { return data_.empty(); }

    /// Output channel c at node (r, g, b)
    double At(int32_t r, int32_t g, int32_t b, int c) const {
        return data_[Index(r, g, b) + c];
    }

    /// Set all three outputs at node (r, g, b)
    void Set(int32_t r, int32_t g, int32_t b, double outR, double outG, double outB) {
        size_t i = Index(r, g, b);
        data_[i] = outR;
        data_[i + 1] = outG;
        data_[i + 2] = outB;
    }

    /// Raw node data, ((b * N + g) * N + r) * 3 + c
    const std::vector<double>& Data() const { return data_; }
    std::vector<double>& Data() { return data_; }

    /// Largest absolute per-value difference to another LUT of the same size
    double MaxDifference(const Lut3D& other) const;

private:
    size_t Index(int32_t r, int32_t g, int32_t b) const {
        return ((static_cast<size_t>(b) * size_ + g) * size_ + r) * 3;
    }

    int32_t size_ = 0;
    std::vector<double> data_;
};

/**
 * @brief Interpolation used by ApplyLut
 */
enum class LutInterpolation {
    Auto,       ///< Tricubic when size >= 4, else trilinear
    Trilinear,
    Tricubic
};

/**
 * @brief Parse "auto", "trilinear" or "tricubic" ("linear"/"cubic" accepted)
 * @throws ConfigurationException otherwise
 */
LOOKFORGE_API LutInterpolation ParseLutInterpolation(const std::string& name);

/**
 * @brief Synthetic image enumerating every lattice node
 *
 * Float32 RGB, width N, height N*N. Flat pixel i holds
 * (i % N, (i / N) % N, i / N^2) / (N-1).
 */
LOOKFORGE_API LImage CreateIdentityLattice(int32_t size);

/**
 * @brief Apply a LUT to an image
 *
 * @param image UInt8 (scaled by 1/255) or Float32 RGB; Gray/RGBA converted first
 * @return UInt8 RGB, round(clamp(v, 0, 1) * 255)
 * @throws InvalidArgumentException if image or lut is empty
 * @throws InvalidArgumentException if Tricubic is requested for size < 4
 */
LOOKFORGE_API LImage ApplyLut(const LImage& image, const Lut3D& lut,
                              LutInterpolation interpolation = LutInterpolation::Auto);

} // namespace Look::Forge::Lut
