#pragma once

/**
 * @file ColorStatistics.h
 * @brief Tonal statistics of a Lab image
 *
 * Provides:
 * - Global per-channel mean / standard deviation
 * - Adaptive tonal zones (shadows, midtones, highlights) and per-zone stats
 * - Normalized per-channel histograms over the fixed Lab ranges
 *
 * Standard deviations are population values (divide by N).
 */

#include <LookForge/Core/Constants.h>
#include <LookForge/Core/Export.h>
#include <LookForge/Core/LabImage.h>
#include <LookForge/Internal/Histogram.h>

#include <array>
#include <cstdint>

namespace Look::Forge::Color {

// =============================================================================
// Data Structures
// =============================================================================

/// Lab channel indices
enum LabChannel : int { LAB_L = 0, LAB_A = 1, LAB_B = 2 };

/**
 * @brief Mean and standard deviation of one channel
 */
struct ChannelStats {
    double mean = 0;
    double stddev = 0;
};

/**
 * @brief Whole-image statistics, indexed by LabChannel
 */
struct GlobalStats {
    std::array<ChannelStats, 3> channels;

    const ChannelStats& operator[](int c) const { return channels[c]; }
    ChannelStats& operator[](int c) { return channels[c]; }
};

/**
 * @brief Statistics of the pixels inside one tonal zone
 */
struct ZoneStats {
    std::array<ChannelStats, 3> channels;
    double pixelRatio = 0;          ///< Fraction of image pixels in the zone, 0 on fallback

    const ChannelStats& operator[](int c) const { return channels[c]; }
    ChannelStats& operator[](int c) { return channels[c]; }
};

enum class Zone { Shadows, Midtones, Highlights };

/**
 * @brief Shadows / midtones / highlights
 */
struct ZoneSet {
    ZoneStats shadows;
    ZoneStats midtones;
    ZoneStats highlights;

    const ZoneStats& Get(Zone zone) const {
        switch (zone) {
            case Zone::Shadows:    return shadows;
            case Zone::Midtones:   return midtones;
            case Zone::Highlights: return highlights;
        }
        return midtones;
    }
};

/**
 * @brief Adaptive split points on the L axis
 *
 * shadowMax is the 25th percentile of L clamped to [15, 45];
 * highlightMin is the 75th percentile clamped to [55, 85].
 */
struct ZoneBoundaries {
    double shadowMax = ZONE_SHADOW_MAX_LOW;
    double highlightMin = ZONE_HIGHLIGHT_MIN_HIGH;
};

/// Normalized histogram of one Lab channel
using ChannelHistogram = Internal::Histogram;

/**
 * @brief Everything extracted from a reference image
 */
struct LookStatistics {
    GlobalStats global;
    ZoneSet zones;
    ZoneBoundaries boundaries;
    std::array<ChannelHistogram, 3> histograms;
};

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Fixed value range of a Lab channel: L [0, 100], a/b [-128, 127]
 */
LOOKFORGE_API void LabChannelRange(int channel, double& minVal, double& maxVal);

/**
 * @brief Population mean / std of one channel
 */
LOOKFORGE_API ChannelStats ComputeChannelStats(const LabImage& lab, int channel);

/**
 * @brief Global mean / std of all three channels
 * @throws InvalidArgumentException if lab is empty
 */
LOOKFORGE_API GlobalStats ComputeGlobalStats(const LabImage& lab);

/**
 * @brief Adaptive zone boundaries from the 25th / 75th percentile of L
 * @throws InvalidArgumentException if lab is empty
 */
LOOKFORGE_API ZoneBoundaries ComputeZoneBoundaries(const LabImage& lab);

/**
 * @brief Per-zone statistics
 *
 * Shadows are L in [0, shadowMax), midtones [shadowMax, highlightMin),
 * highlights [highlightMin, 100]. A zone holding fewer than ZONE_MIN_PIXELS
 * pixels reports the global statistics with pixelRatio 0.
 */
LOOKFORGE_API ZoneSet ComputeZoneStats(const LabImage& lab, const ZoneBoundaries& boundaries);

/**
 * @brief Normalized histograms of L, a, b
 *
 * Values outside the fixed channel range are not counted; counts are divided
 * by (sum + 1e-10).
 */
LOOKFORGE_API std::array<ChannelHistogram, 3> ComputeHistograms(
    const LabImage& lab, int32_t bins = LAB_HISTOGRAM_BINS);

/**
 * @brief Global, zone (own boundaries) and histogram statistics in one pass
 */
LOOKFORGE_API LookStatistics ExtractStatistics(const LabImage& lab);

} // namespace Look::Forge::Color
