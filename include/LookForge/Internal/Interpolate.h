#pragma once

/**
 * @file Interpolate.h
 * @brief Trilinear and tricubic sampling of a regular RGB lattice
 *
 * The lattice holds size^3 nodes of 3 values each, R index fastest:
 *   grid[((b * size + g) * size + r) * 3 + c]
 * Node i sits at coordinate i / (size - 1) on each axis.
 */

#include <cstdint>

namespace Look::Forge::Internal {

/**
 * @brief Keys cubic convolution kernel (Catmull-Rom, a = -0.5)
 */
inline double CubicKernel(double x) {
    x = x < 0 ? -x : x;
    if (x < 1.0) {
        return (1.5 * x - 2.5) * x * x + 1.0;
    } else if (x < 2.0) {
        return ((-0.5 * x + 2.5) * x - 4.0) * x + 2.0;
    }
    return 0.0;
}

/**
 * @brief Trilinear sample at normalized (r, g, b), inputs clamped to [0, 1]
 * @param[out] out Three interpolated values
 */
void SampleTrilinear(const double* grid, int32_t size,
                     double r, double g, double b, double out[3]);

/**
 * @brief Tricubic (4x4x4 Keys) sample at normalized (r, g, b)
 *
 * Nodes one step outside the lattice are extrapolated linearly from the two
 * nearest edge nodes. Requires size >= 4.
 */
void SampleTricubic(const double* grid, int32_t size,
                    double r, double g, double b, double out[3]);

} // namespace Look::Forge::Internal
