#pragma once

/**
 * @file Constants.h
 * @brief Library-wide constants
 */

#include <cstddef>
#include <cstdint>

namespace Look::Forge {

// =============================================================================
// Memory
// =============================================================================

/// Row alignment for image buffers (AVX512 cache line)
constexpr size_t MEMORY_ALIGNMENT = 64;

// =============================================================================
// Perceptual (CIE L*a*b*) ranges
// =============================================================================

constexpr double LAB_L_MIN = 0.0;
constexpr double LAB_L_MAX = 100.0;
constexpr double LAB_AB_MIN = -128.0;
constexpr double LAB_AB_MAX = 127.0;

/// Floor applied to standard deviations before dividing by them
constexpr double STD_EPSILON = 1e-6;

// =============================================================================
// Statistics
// =============================================================================

/// Histogram bins per Lab channel
constexpr int32_t LAB_HISTOGRAM_BINS = 512;

/// Zones with fewer pixels fall back to whole-image statistics
constexpr int64_t ZONE_MIN_PIXELS = 10;

/// Clamp ranges for the adaptive zone boundaries
constexpr double ZONE_SHADOW_MAX_LOW = 15.0;
constexpr double ZONE_SHADOW_MAX_HIGH = 45.0;
constexpr double ZONE_HIGHLIGHT_MIN_LOW = 55.0;
constexpr double ZONE_HIGHLIGHT_MIN_HIGH = 85.0;

/// Sigmoid transition width between zones (L units)
constexpr double ZONE_TRANSITION_WIDTH = 8.0;

} // namespace Look::Forge
