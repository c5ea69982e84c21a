#pragma once

/**
 * @file Preset.h
 * @brief Editing-application preset values derived from a reference look
 *
 * Field names follow the Camera Raw settings (crs:) schema they serialize to.
 */

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Look::Forge::Preset {

// =============================================================================
// Basic tone
// =============================================================================

/**
 * @brief Basic panel adjustments
 */
struct ToneParams {
    double exposure = 0;        ///< [-5, 5]
    double contrast = 0;        ///< [-100, 100]
    double highlights = 0;      ///< [-100, 100]
    double shadows = 0;         ///< [-100, 100]
    double whites = 0;          ///< [-100, 100]
    double blacks = 0;          ///< [-100, 100]
    double texture = 0;         ///< [-100, 100], written as integer
    double clarity = 0;         ///< [-100, 100]
    double dehaze = 0;          ///< [-100, 100]
    double vibrance = 0;        ///< [0, 100]
    double saturation = 0;      ///< [-10, 10], written as integer
};

// =============================================================================
// Split toning / color grading
// =============================================================================

struct SplitToningParams {
    int shadowHue = 0;              ///< Degrees [0, 360)
    int shadowSaturation = 0;       ///< [0, 100]
    int highlightHue = 0;
    int highlightSaturation = 0;
    int balance = 0;
    int midtoneHue = 0;
    int midtoneSaturation = 0;
    int shadowLum = 0;
    int midtoneLum = 0;
    int highlightLum = 0;
    int blending = 50;
    int globalHue = 0;
    int globalSat = 0;
    int globalLum = 0;
};

// =============================================================================
// HSL
// =============================================================================

/// Hue buckets of the HSL panel, in serialization order
enum class HslColor { Red, Orange, Yellow, Green, Aqua, Blue, Purple, Magenta };

constexpr int HSL_COLOR_COUNT = 8;

/**
 * @brief Hue interval [lo, hi) in degrees; lo > hi wraps through 0
 */
struct HslRange {
    const char* name;
    double lo;
    double hi;
};

constexpr HslRange HSL_RANGES[HSL_COLOR_COUNT] = {
    {"Red",     345, 15},
    {"Orange",   15, 45},
    {"Yellow",   45, 75},
    {"Green",    75, 165},
    {"Aqua",    165, 195},
    {"Blue",    195, 255},
    {"Purple",  255, 315},
    {"Magenta", 315, 345},
};

/**
 * @brief Per-bucket adjustments, indexed by HslColor
 */
struct HslParams {
    std::array<int, HSL_COLOR_COUNT> hue{};
    std::array<int, HSL_COLOR_COUNT> saturation{};
    std::array<int, HSL_COLOR_COUNT> luminance{};
};

// =============================================================================
// Curves
// =============================================================================

struct ParametricCurve {
    int shadows = 0;            ///< [-50, 50]
    int darks = 0;
    int lights = 0;
    int highlights = 0;
    int shadowSplit = 25;
    int midtoneSplit = 50;
    int highlightSplit = 75;
};

struct CurvePoint {
    int x = 0;
    int y = 0;
};

using ToneCurve = std::vector<CurvePoint>;

struct CurveParams {
    ParametricCurve parametric;
    ToneCurve luminance;        ///< ToneCurvePV2012
    ToneCurve red;
    ToneCurve green;
    ToneCurve blue;
};

// =============================================================================
// Detail
// =============================================================================

struct DetailParams {
    int sharpness = 0;                          ///< [0, 80]
    double sharpenRadius = 1.0;
    int sharpenDetail = 25;
    int sharpenEdgeMasking = 0;
    int luminanceSmoothing = 0;                 ///< [0, 50]
    int luminanceNoiseReductionDetail = 50;
    int luminanceNoiseReductionContrast = 0;
    int colorNoiseReduction = 25;
    int colorNoiseReductionDetail = 50;
    int colorNoiseReductionSmoothness = 50;
};

// =============================================================================
// Preset
// =============================================================================

struct Preset {
    std::string name;
    std::string uuid;           ///< 32 upper-case hex digits
    ToneParams tone;
    DetailParams detail;
    HslParams hsl;
    SplitToningParams splitToning;
    CurveParams curves;
};

} // namespace Look::Forge::Preset
