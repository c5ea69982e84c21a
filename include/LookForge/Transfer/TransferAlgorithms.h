#pragma once

/**
 * @file TransferAlgorithms.h
 * @brief Statistical color transfer in Lab space
 *
 * Each algorithm maps a target Lab image toward the look of a reference Lab
 * image and returns a new image clamped to L [0, 100], a/b [-128, 127].
 * Inputs are never modified.
 *
 * Algorithms:
 * - TransferGlobalLab: per-channel mean/std matching (Reinhard)
 * - TransferZoneBased: chroma matched per tonal zone with sigmoid blending
 * - TransferHistogram: per-channel CDF matching
 * - TransferImproved: histogram matching followed by zone chroma matching
 */

#include <LookForge/Color/ColorStatistics.h>
#include <LookForge/Core/Constants.h>
#include <LookForge/Core/Export.h>
#include <LookForge/Core/LabImage.h>

#include <cstdint>
#include <vector>

namespace Look::Forge::Transfer {

/**
 * @brief Per-pixel soft zone memberships, each triple sums to 1
 */
struct ZoneWeights {
    std::vector<double> shadows;
    std::vector<double> midtones;
    std::vector<double> highlights;
};

/**
 * @brief Logistic step 1 / (1 + exp(-x / max(width, 0.1)))
 */
LOOKFORGE_API double Sigmoid(double x, double width);

/**
 * @brief Soft zone weights from the L channel of lab
 *
 * shadow = Sigmoid(shadowMax - L), highlight = Sigmoid(L - highlightMin),
 * midtone = clamp(1 - shadow - highlight, 0, 1), then renormalized.
 */
LOOKFORGE_API ZoneWeights ComputeZoneWeights(const LabImage& lab,
                                             const Color::ZoneBoundaries& boundaries,
                                             double width = ZONE_TRANSITION_WIDTH);

/**
 * @brief (value - src.mean) / max(src.stddev, 1e-6) * ref.stddev + ref.mean
 */
inline double ReinhardValue(double value, const Color::ChannelStats& src,
                            const Color::ChannelStats& ref) {
    double srcStd = src.stddev < STD_EPSILON ? STD_EPSILON : src.stddev;
    return (value - src.mean) / srcStd * ref.stddev + ref.mean;
}

/**
 * @brief Map one channel onto the distribution of another by CDF matching
 *
 * Both channels are binned over [minVal, maxVal]. Each source value is
 * replaced by the reference bin center whose CDF equals the source bin CDF
 * (linear interpolation, clamped at both ends).
 */
LOOKFORGE_API std::vector<double> HistogramMatchChannel(
    const std::vector<double>& source, const std::vector<double>& reference,
    double minVal, double maxVal, int32_t bins = LAB_HISTOGRAM_BINS);

LOOKFORGE_API LabImage TransferGlobalLab(const LabImage& reference, const LabImage& target);

/**
 * @brief Zone-based transfer
 *
 * a/b are matched separately in each zone (each image uses its own
 * boundaries) and blended with the target's soft zone weights. L gets the
 * global mean/std mapping.
 */
LOOKFORGE_API LabImage TransferZoneBased(const LabImage& reference, const LabImage& target);

LOOKFORGE_API LabImage TransferHistogram(const LabImage& reference, const LabImage& target);

/**
 * @brief Histogram matching, then zone chroma matching on the intermediate
 *
 * Zone statistics of the second step come from the histogram-matched image.
 * L is left as histogram-matched.
 */
LOOKFORGE_API LabImage TransferImproved(const LabImage& reference, const LabImage& target);

} // namespace Look::Forge::Transfer
