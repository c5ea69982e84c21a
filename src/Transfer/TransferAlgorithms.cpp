/**
 * @file TransferAlgorithms.cpp
 * @brief Lab color transfer implementation
 */

#include <LookForge/Transfer/TransferAlgorithms.h>
#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Internal/Histogram.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <string>

using Look::Forge::Color::LAB_A;
using Look::Forge::Color::LAB_B;
using Look::Forge::Color::LAB_L;

namespace Look::Forge::Transfer {

namespace {

constexpr double MIN_SIGMOID_WIDTH = 0.1;
constexpr double WEIGHT_EPSILON = 1e-10;

void RequireInputs(const LabImage& reference, const LabImage& target, const char* funcName) {
    if (reference.Empty() || target.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": Lab image is empty");
    }
}

/**
 * Replace a/b of out with the zone-weighted Reinhard mapping of source.
 * source supplies the pixel values, zone weights and source statistics.
 */
void ApplyZoneChroma(const LabImage& source, const LabImage& reference, LabImage& out) {
    Color::ZoneBoundaries srcBounds = Color::ComputeZoneBoundaries(source);
    Color::ZoneBoundaries refBounds = Color::ComputeZoneBoundaries(reference);
    Color::ZoneSet srcZones = Color::ComputeZoneStats(source, srcBounds);
    Color::ZoneSet refZones = Color::ComputeZoneStats(reference, refBounds);

    ZoneWeights w = ComputeZoneWeights(source, srcBounds);

    const size_t n = source.PixelCount();
    for (int c : {LAB_A, LAB_B}) {
        for (size_t i = 0; i < n; ++i) {
            double v = source.At(i, c);
            double s = ReinhardValue(v, srcZones.shadows[c], refZones.shadows[c]);
            double m = ReinhardValue(v, srcZones.midtones[c], refZones.midtones[c]);
            double h = ReinhardValue(v, srcZones.highlights[c], refZones.highlights[c]);
            out.At(i, c) = w.shadows[i] * s + w.midtones[i] * m + w.highlights[i] * h;
        }
    }
}

} // namespace

// =============================================================================
// Helpers
// =============================================================================

double Sigmoid(double x, double width) {
    return 1.0 / (1.0 + std::exp(-x / std::max(width, MIN_SIGMOID_WIDTH)));
}

ZoneWeights ComputeZoneWeights(const LabImage& lab, const Color::ZoneBoundaries& boundaries,
                               double width) {
    const size_t n = lab.PixelCount();
    ZoneWeights w;
    w.shadows.resize(n);
    w.midtones.resize(n);
    w.highlights.resize(n);

    for (size_t i = 0; i < n; ++i) {
        double L = lab.At(i, LAB_L);
        double s = Sigmoid(boundaries.shadowMax - L, width);
        double h = Sigmoid(L - boundaries.highlightMin, width);
        double m = std::clamp(1.0 - s - h, 0.0, 1.0);

        double sum = std::max(s + m + h, WEIGHT_EPSILON);
        w.shadows[i] = s / sum;
        w.midtones[i] = m / sum;
        w.highlights[i] = h / sum;
    }

    return w;
}

std::vector<double> HistogramMatchChannel(const std::vector<double>& source,
                                          const std::vector<double>& reference,
                                          double minVal, double maxVal, int32_t bins) {
    Internal::Histogram srcHist = Internal::ComputeHistogram(source, bins, minVal, maxVal);
    Internal::Histogram refHist = Internal::ComputeHistogram(reference, bins, minVal, maxVal);

    std::vector<double> srcCdf = Internal::ComputeCumulativeHistogram(srcHist);
    std::vector<double> refCdf = Internal::ComputeCumulativeHistogram(refHist);

    std::vector<double> refCenters(bins);
    for (int32_t i = 0; i < bins; ++i) {
        refCenters[i] = refHist.BinCenter(i);
    }

    // Mapping from source bin to reference value
    std::vector<double> lut(bins);
    for (int32_t i = 0; i < bins; ++i) {
        lut[i] = Internal::Interp(srcCdf[i], refCdf, refCenters);
    }

    double binWidth = (maxVal - minVal) / bins;
    std::vector<double> result(source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        // Truncation toward zero, then clip into the table
        double pos = (source[i] - minVal) / binWidth;
        int32_t idx = static_cast<int32_t>(std::clamp(pos, -1.0, static_cast<double>(bins)));
        idx = std::clamp(idx, 0, bins - 1);
        result[i] = lut[idx];
    }

    return result;
}

// =============================================================================
// Global Lab (Reinhard)
// =============================================================================

LabImage TransferGlobalLab(const LabImage& reference, const LabImage& target) {
    RequireInputs(reference, target, "TransferGlobalLab");

    Color::GlobalStats ref = Color::ComputeGlobalStats(reference);
    Color::GlobalStats tgt = Color::ComputeGlobalStats(target);

    LabImage out = target;
    std::vector<double>& values = out.Values();
    for (size_t i = 0; i < values.size(); i += 3) {
        for (int c = 0; c < 3; ++c) {
            values[i + c] = ReinhardValue(values[i + c], tgt[c], ref[c]);
        }
    }

    Color::ClampLab(out);
    return out;
}

// =============================================================================
// Zone-based
// =============================================================================

LabImage TransferZoneBased(const LabImage& reference, const LabImage& target) {
    RequireInputs(reference, target, "TransferZoneBased");

    LabImage out = target;
    ApplyZoneChroma(target, reference, out);

    Color::ChannelStats refL = Color::ComputeChannelStats(reference, LAB_L);
    Color::ChannelStats tgtL = Color::ComputeChannelStats(target, LAB_L);
    const size_t n = target.PixelCount();
    for (size_t i = 0; i < n; ++i) {
        out.At(i, LAB_L) = ReinhardValue(target.At(i, LAB_L), tgtL, refL);
    }

    Color::ClampLab(out);
    return out;
}

// =============================================================================
// Histogram matching
// =============================================================================

LabImage TransferHistogram(const LabImage& reference, const LabImage& target) {
    RequireInputs(reference, target, "TransferHistogram");

    LabImage out = target;
    const size_t n = target.PixelCount();
    for (int c = 0; c < 3; ++c) {
        double lo, hi;
        Color::LabChannelRange(c, lo, hi);
        std::vector<double> matched =
            HistogramMatchChannel(target.Channel(c), reference.Channel(c), lo, hi);
        for (size_t i = 0; i < n; ++i) {
            out.At(i, c) = matched[i];
        }
    }

    Color::ClampLab(out);
    return out;
}

// =============================================================================
// Improved (histogram + zone chroma)
// =============================================================================

LabImage TransferImproved(const LabImage& reference, const LabImage& target) {
    RequireInputs(reference, target, "TransferImproved");

    LabImage step1 = TransferHistogram(reference, target);
    LabImage out = step1;
    ApplyZoneChroma(step1, reference, out);

    Color::ClampLab(out);
    return out;
}

} // namespace Look::Forge::Transfer
