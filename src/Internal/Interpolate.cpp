/**
 * @file Interpolate.cpp
 * @brief Lattice sampling implementation
 */

#include <LookForge/Internal/Interpolate.h>

#include <algorithm>
#include <cmath>

namespace Look::Forge::Internal {

namespace {

inline size_t NodeIndex(int32_t size, int32_t r, int32_t g, int32_t b) {
    return ((static_cast<size_t>(b) * size + g) * size + r) * 3;
}

// Node value with linear extrapolation one step past each face
double Node(const double* grid, int32_t size, int32_t r, int32_t g, int32_t b, int c) {
    if (r < 0) {
        return 2.0 * Node(grid, size, 0, g, b, c) - Node(grid, size, 1, g, b, c);
    }
    if (r >= size) {
        return 2.0 * Node(grid, size, size - 1, g, b, c) - Node(grid, size, size - 2, g, b, c);
    }
    if (g < 0) {
        return 2.0 * Node(grid, size, r, 0, b, c) - Node(grid, size, r, 1, b, c);
    }
    if (g >= size) {
        return 2.0 * Node(grid, size, r, size - 1, b, c) - Node(grid, size, r, size - 2, b, c);
    }
    if (b < 0) {
        return 2.0 * Node(grid, size, r, g, 0, c) - Node(grid, size, r, g, 1, c);
    }
    if (b >= size) {
        return 2.0 * Node(grid, size, r, g, size - 1, c) - Node(grid, size, r, g, size - 2, c);
    }
    return grid[NodeIndex(size, r, g, b) + c];
}

// Split a normalized coordinate into a cell index in [0, size-2] and fraction
inline void Locate(double v, int32_t size, int32_t& cell, double& frac) {
    double pos = std::clamp(v, 0.0, 1.0) * (size - 1);
    cell = std::min(static_cast<int32_t>(std::floor(pos)), size - 2);
    frac = pos - cell;
}

} // namespace

void SampleTrilinear(const double* grid, int32_t size,
                     double r, double g, double b, double out[3]) {
    int32_t r0, g0, b0;
    double fr, fg, fb;
    Locate(r, size, r0, fr);
    Locate(g, size, g0, fg);
    Locate(b, size, b0, fb);

    for (int c = 0; c < 3; ++c) {
        double v000 = grid[NodeIndex(size, r0, g0, b0) + c];
        double v100 = grid[NodeIndex(size, r0 + 1, g0, b0) + c];
        double v010 = grid[NodeIndex(size, r0, g0 + 1, b0) + c];
        double v110 = grid[NodeIndex(size, r0 + 1, g0 + 1, b0) + c];
        double v001 = grid[NodeIndex(size, r0, g0, b0 + 1) + c];
        double v101 = grid[NodeIndex(size, r0 + 1, g0, b0 + 1) + c];
        double v011 = grid[NodeIndex(size, r0, g0 + 1, b0 + 1) + c];
        double v111 = grid[NodeIndex(size, r0 + 1, g0 + 1, b0 + 1) + c];

        double c00 = v000 * (1 - fr) + v100 * fr;
        double c10 = v010 * (1 - fr) + v110 * fr;
        double c01 = v001 * (1 - fr) + v101 * fr;
        double c11 = v011 * (1 - fr) + v111 * fr;

        double c0 = c00 * (1 - fg) + c10 * fg;
        double c1 = c01 * (1 - fg) + c11 * fg;

        out[c] = c0 * (1 - fb) + c1 * fb;
    }
}

void SampleTricubic(const double* grid, int32_t size,
                    double r, double g, double b, double out[3]) {
    int32_t r0, g0, b0;
    double fr, fg, fb;
    Locate(r, size, r0, fr);
    Locate(g, size, g0, fg);
    Locate(b, size, b0, fb);

    double wr[4], wg[4], wb[4];
    for (int i = 0; i < 4; ++i) {
        wr[i] = CubicKernel(fr - (i - 1));
        wg[i] = CubicKernel(fg - (i - 1));
        wb[i] = CubicKernel(fb - (i - 1));
    }

    for (int c = 0; c < 3; ++c) {
        double result = 0.0;
        for (int k = 0; k < 4; ++k) {
            for (int j = 0; j < 4; ++j) {
                double wjk = wg[j] * wb[k];
                for (int i = 0; i < 4; ++i) {
                    double v = Node(grid, size, r0 - 1 + i, g0 - 1 + j, b0 - 1 + k, c);
                    result += v * wr[i] * wjk;
                }
            }
        }
        out[c] = result;
    }
}

} // namespace Look::Forge::Internal
