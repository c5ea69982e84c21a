/**
 * @file Histogram.cpp
 * @brief Fixed-range histogram implementation
 */

#include <LookForge/Internal/Histogram.h>
#include <LookForge/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace Look::Forge::Internal {

namespace {
constexpr double NORMALIZE_EPSILON = 1e-10;
}

// ============================================================================
// Histogram
// ============================================================================

Histogram::Histogram(int32_t nBins, double minVal, double maxVal)
    : counts(nBins, 0.0), edges(nBins + 1), numBins(nBins),
      minValue(minVal), maxValue(maxVal)
{
    if (nBins <= 0 || maxVal <= minVal) {
        throw InvalidArgumentException("Histogram: invalid bin count or range");
    }
    double step = (maxVal - minVal) / nBins;
    for (int32_t i = 0; i <= nBins; ++i) {
        edges[i] = minVal + step * i;
    }
    edges[nBins] = maxVal;
}

int32_t Histogram::BinOf(double value) const {
    if (!(value >= minValue && value <= maxValue)) {
        return -1;
    }

    int32_t idx = static_cast<int32_t>((value - minValue) * numBins / (maxValue - minValue));
    if (idx >= numBins) idx = numBins - 1;

    // Correct for rounding at bin edges
    if (value < edges[idx]) {
        --idx;
    } else if (idx < numBins - 1 && value >= edges[idx + 1]) {
        ++idx;
    }
    return idx;
}

double Histogram::Total() const {
    return std::accumulate(counts.begin(), counts.end(), 0.0);
}

// ============================================================================
// Histogram Computation
// ============================================================================

Histogram ComputeHistogram(const std::vector<double>& values, int32_t numBins,
                           double minVal, double maxVal) {
    Histogram hist(numBins, minVal, maxVal);

    for (double v : values) {
        int32_t idx = hist.BinOf(v);
        if (idx >= 0) {
            hist.counts[idx] += 1.0;
        }
    }

    return hist;
}

void NormalizeHistogram(Histogram& hist) {
    double total = hist.Total() + NORMALIZE_EPSILON;
    for (double& c : hist.counts) {
        c /= total;
    }
}

std::vector<double> ComputeCumulativeHistogram(const Histogram& hist) {
    std::vector<double> cdf(hist.numBins, 0.0);

    double sum = 0;
    for (int32_t i = 0; i < hist.numBins; ++i) {
        sum += hist.counts[i];
        cdf[i] = sum;
    }

    double last = (hist.numBins > 0 ? cdf.back() : 0.0) + NORMALIZE_EPSILON;
    for (double& c : cdf) {
        c /= last;
    }

    return cdf;
}

// ============================================================================
// Sample Statistics
// ============================================================================

double ComputePercentile(std::vector<double> values, double percentile) {
    if (values.empty()) {
        return 0;
    }

    percentile = std::max(0.0, std::min(100.0, percentile));
    double rank = percentile / 100.0 * static_cast<double>(values.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = std::min(lo + 1, values.size() - 1);
    double frac = rank - static_cast<double>(lo);

    std::nth_element(values.begin(), values.begin() + lo, values.end());
    double loVal = values[lo];
    if (hi == lo || frac == 0.0) {
        return loVal;
    }

    // Smallest element above position lo is the next order statistic
    double hiVal = *std::min_element(values.begin() + lo + 1, values.end());
    return loVal + (hiVal - loVal) * frac;
}

double Interp(double x, const std::vector<double>& xp, const std::vector<double>& fp) {
    if (xp.empty()) {
        return 0;
    }
    if (x <= xp.front()) {
        return fp.front();
    }
    if (x > xp.back()) {
        return fp.back();
    }

    // First j with xp[j] >= x; ties resolve to the start of a flat run
    size_t j = static_cast<size_t>(std::lower_bound(xp.begin(), xp.end(), x) - xp.begin());
    if (xp[j] == x) {
        return fp[j];
    }
    return fp[j - 1] + (fp[j] - fp[j - 1]) * (x - xp[j - 1]) / (xp[j] - xp[j - 1]);
}

} // namespace Look::Forge::Internal
