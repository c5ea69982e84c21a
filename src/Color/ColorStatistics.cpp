/**
 * @file ColorStatistics.cpp
 * @brief Tonal statistics implementation
 */

#include <LookForge/Color/ColorStatistics.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Platform/Logger.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace Look::Forge::Color {

namespace {

void RequireNonEmpty(const LabImage& lab, const char* funcName) {
    if (lab.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": Lab image is empty");
    }
}

const char* ZoneName(Zone zone) {
    switch (zone) {
        case Zone::Shadows:    return "shadows";
        case Zone::Midtones:   return "midtones";
        case Zone::Highlights: return "highlights";
    }
    return "unknown";
}

bool InZone(double L, Zone zone, const ZoneBoundaries& b) {
    switch (zone) {
        case Zone::Shadows:    return L >= LAB_L_MIN && L < b.shadowMax;
        case Zone::Midtones:   return L >= b.shadowMax && L < b.highlightMin;
        case Zone::Highlights: return L >= b.highlightMin && L <= LAB_L_MAX;
    }
    return false;
}

ZoneStats ComputeOneZone(const LabImage& lab, Zone zone, const ZoneBoundaries& boundaries,
                         const GlobalStats& global) {
    const size_t n = lab.PixelCount();

    double sum[3] = {0, 0, 0};
    int64_t count = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!InZone(lab.At(i, LAB_L), zone, boundaries)) continue;
        for (int c = 0; c < 3; ++c) {
            sum[c] += lab.At(i, c);
        }
        ++count;
    }

    ZoneStats stats;
    if (count < ZONE_MIN_PIXELS) {
        Log::Debug("Zone {} has {} pixel(s), using global statistics", ZoneName(zone), count);
        stats.channels = global.channels;
        stats.pixelRatio = 0.0;
        return stats;
    }

    double mean[3];
    for (int c = 0; c < 3; ++c) {
        mean[c] = sum[c] / static_cast<double>(count);
    }

    double sq[3] = {0, 0, 0};
    for (size_t i = 0; i < n; ++i) {
        if (!InZone(lab.At(i, LAB_L), zone, boundaries)) continue;
        for (int c = 0; c < 3; ++c) {
            double d = lab.At(i, c) - mean[c];
            sq[c] += d * d;
        }
    }

    for (int c = 0; c < 3; ++c) {
        stats.channels[c].mean = mean[c];
        stats.channels[c].stddev = std::sqrt(sq[c] / static_cast<double>(count));
    }
    stats.pixelRatio = static_cast<double>(count) / static_cast<double>(n);
    return stats;
}

} // namespace

void LabChannelRange(int channel, double& minVal, double& maxVal) {
    if (channel == LAB_L) {
        minVal = LAB_L_MIN;
        maxVal = LAB_L_MAX;
    } else {
        minVal = LAB_AB_MIN;
        maxVal = LAB_AB_MAX;
    }
}

ChannelStats ComputeChannelStats(const LabImage& lab, int channel) {
    RequireNonEmpty(lab, "ComputeChannelStats");

    const size_t n = lab.PixelCount();
    double sum = 0;
    for (size_t i = 0; i < n; ++i) {
        sum += lab.At(i, channel);
    }

    ChannelStats stats;
    stats.mean = sum / static_cast<double>(n);

    double sq = 0;
    for (size_t i = 0; i < n; ++i) {
        double d = lab.At(i, channel) - stats.mean;
        sq += d * d;
    }
    stats.stddev = std::sqrt(sq / static_cast<double>(n));
    return stats;
}

GlobalStats ComputeGlobalStats(const LabImage& lab) {
    RequireNonEmpty(lab, "ComputeGlobalStats");

    GlobalStats stats;
    for (int c = 0; c < 3; ++c) {
        stats.channels[c] = ComputeChannelStats(lab, c);
    }
    return stats;
}

ZoneBoundaries ComputeZoneBoundaries(const LabImage& lab) {
    RequireNonEmpty(lab, "ComputeZoneBoundaries");

    std::vector<double> L = lab.Channel(LAB_L);
    double p25 = Internal::ComputePercentile(L, 25.0);
    double p75 = Internal::ComputePercentile(std::move(L), 75.0);

    ZoneBoundaries b;
    b.shadowMax = std::clamp(p25, ZONE_SHADOW_MAX_LOW, ZONE_SHADOW_MAX_HIGH);
    b.highlightMin = std::clamp(p75, ZONE_HIGHLIGHT_MIN_LOW, ZONE_HIGHLIGHT_MIN_HIGH);
    return b;
}

ZoneSet ComputeZoneStats(const LabImage& lab, const ZoneBoundaries& boundaries) {
    GlobalStats global = ComputeGlobalStats(lab);

    ZoneSet zones;
    zones.shadows = ComputeOneZone(lab, Zone::Shadows, boundaries, global);
    zones.midtones = ComputeOneZone(lab, Zone::Midtones, boundaries, global);
    zones.highlights = ComputeOneZone(lab, Zone::Highlights, boundaries, global);
    return zones;
}

std::array<ChannelHistogram, 3> ComputeHistograms(const LabImage& lab, int32_t bins) {
    RequireNonEmpty(lab, "ComputeHistograms");

    std::array<ChannelHistogram, 3> hists;
    for (int c = 0; c < 3; ++c) {
        double lo, hi;
        LabChannelRange(c, lo, hi);
        hists[c] = Internal::ComputeHistogram(lab.Channel(c), bins, lo, hi);
        Internal::NormalizeHistogram(hists[c]);
    }
    return hists;
}

LookStatistics ExtractStatistics(const LabImage& lab) {
    LookStatistics stats;
    stats.boundaries = ComputeZoneBoundaries(lab);
    stats.global = ComputeGlobalStats(lab);
    stats.zones = ComputeZoneStats(lab, stats.boundaries);
    stats.histograms = ComputeHistograms(lab);

    Log::Debug("Statistics: L mean {:.2f} std {:.2f}, zones [{:.1f}, {:.1f}]",
               stats.global[LAB_L].mean, stats.global[LAB_L].stddev,
               stats.boundaries.shadowMax, stats.boundaries.highlightMin);
    return stats;
}

} // namespace Look::Forge::Color
