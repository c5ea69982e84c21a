#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for LookForge
 */

#include <cstdint>
#include <LookForge/Core/Export.h>

namespace Look::Forge {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Supported pixel data types
 */
enum class PixelType {
    UInt8,      ///< 8-bit unsigned [0, 255]
    Float32     ///< 32-bit float, color images normalized to [0, 1]
};

/**
 * @brief Image channel types
 */
enum class ChannelType {
    Gray,       ///< Single channel grayscale
    RGB,        ///< 3 channels RGB
    RGBA        ///< 4 channels RGBA
};

// =============================================================================
// Point Types
// =============================================================================

/**
 * @brief 2D point with integer coordinates
 *
 * Used for tone-curve anchors (input, output) in [0, 255].
 */
struct LOOKFORGE_API Point2i {
    int32_t x = 0;
    int32_t y = 0;

    Point2i() = default;
    Point2i(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    bool operator==(const Point2i& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point2i& other) const { return !(*this == other); }
};

/**
 * @brief Triple of doubles (one value per color channel)
 */
struct LOOKFORGE_API Color3d {
    double c0 = 0.0;
    double c1 = 0.0;
    double c2 = 0.0;

    Color3d() = default;
    Color3d(double a, double b, double c) : c0(a), c1(b), c2(c) {}

    double operator[](int idx) const { return idx == 0 ? c0 : (idx == 1 ? c1 : c2); }
    double& operator[](int idx) { return idx == 0 ? c0 : (idx == 1 ? c1 : c2); }
};

} // namespace Look::Forge
