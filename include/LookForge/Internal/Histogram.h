#pragma once

/**
 * @file Histogram.h
 * @brief Fixed-range histograms over double-precision samples
 *
 * Provides:
 * - Histogram computation over a fixed [min, max] range
 * - Normalized and cumulative histograms
 * - Percentiles with linear interpolation between order statistics
 * - Piecewise-linear interpolation with clamped ends
 *
 * Used by:
 * - Color statistics (zone boundaries, Lab histograms)
 * - Histogram matching transfer
 */

#include <LookForge/Core/Constants.h>

#include <cstdint>
#include <vector>

namespace Look::Forge::Internal {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief 1D histogram with explicit bin edges
 *
 * Bin i covers [edges[i], edges[i+1]); the last bin also includes maxValue.
 */
struct Histogram {
    std::vector<double> counts;     ///< Bin counts (raw or normalized)
    std::vector<double> edges;      ///< numBins + 1 bin edges
    int32_t numBins = 0;            ///< Number of bins
    double minValue = 0;            ///< Range minimum
    double maxValue = 0;            ///< Range maximum

    Histogram() = default;

    /// Empty histogram over [minVal, maxVal] with evenly spaced edges
    Histogram(int32_t nBins, double minVal, double maxVal);

    /// Bin width
    double BinWidth() const { return (maxValue - minValue) / numBins; }

    /// Center of bin idx
    double BinCenter(int32_t idx) const { return (edges[idx] + edges[idx + 1]) / 2.0; }

    /**
     * @brief Bin index for a value, or -1 if outside [minValue, maxValue]
     */
    int32_t BinOf(double value) const;

    /// Sum of all counts
    double Total() const;
};

// ============================================================================
// Histogram Computation
// ============================================================================

/**
 * @brief Count values into numBins bins over [minVal, maxVal]
 *
 * Values outside the range are ignored.
 */
Histogram ComputeHistogram(const std::vector<double>& values, int32_t numBins,
                           double minVal, double maxVal);

/**
 * @brief Divide counts by (sum + 1e-10)
 */
void NormalizeHistogram(Histogram& hist);

/**
 * @brief Running sum of counts divided by (last + 1e-10)
 */
std::vector<double> ComputeCumulativeHistogram(const Histogram& hist);

// ============================================================================
// Sample Statistics
// ============================================================================

/**
 * @brief Percentile of unsorted samples, linear interpolation between ranks
 * @param percentile In [0, 100]
 * @return 0 for an empty sample
 */
double ComputePercentile(std::vector<double> values, double percentile);

/**
 * @brief Piecewise-linear interpolation of (xp, fp) at x
 *
 * xp must be non-decreasing. Values left of xp[0] return fp[0]; values right
 * of xp.back() return fp.back(). When x equals several tied xp entries the
 * first one wins, so a CDF maps onto itself.
 */
double Interp(double x, const std::vector<double>& xp, const std::vector<double>& fp);

} // namespace Look::Forge::Internal
