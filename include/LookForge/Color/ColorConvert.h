#pragma once

/**
 * @file ColorConvert.h
 * @brief Color space conversion (sRGB, CIE L*a*b*, HSV)
 *
 * All conversions are double precision on normalized values:
 * - RGB: gamma-encoded sRGB in [0, 1]
 * - Lab: D65, L in [0, 100], a/b roughly in [-128, 127]
 * - HSV: hue in degrees [0, 360), saturation and value in [0, 1]
 *
 * Round trip RGB -> Lab -> RGB is exact to ~1e-7.
 */

#include <LookForge/Core/LImage.h>
#include <LookForge/Core/LabImage.h>
#include <LookForge/Core/Export.h>

namespace Look::Forge::Color {

// =============================================================================
// Per-pixel conversion
// =============================================================================

/**
 * @brief Convert sRGB [0,1] to Lab
 * @param r,g,b Gamma-encoded sRGB in [0, 1]
 * @param[out] L Lightness [0, 100]
 * @param[out] a Green-red axis
 * @param[out] labB Blue-yellow axis
 */
LOOKFORGE_API void RgbToLab(double r, double g, double b, double& L, double& a, double& labB);

/**
 * @brief Convert Lab to sRGB [0,1]
 *
 * Out-of-gamut results are clipped to [0, 1].
 */
LOOKFORGE_API void LabToRgb(double L, double a, double labB, double& r, double& g, double& b);

/**
 * @brief Convert sRGB [0,1] to HSV
 * @param[out] h Hue in degrees [0, 360); 0 for achromatic pixels
 * @param[out] s Saturation (max - min) / max, 0 for black
 * @param[out] v Value max(r, g, b)
 */
LOOKFORGE_API void RgbToHsv(double r, double g, double b, double& h, double& s, double& v);

// =============================================================================
// Image conversion
// =============================================================================

/**
 * @brief Convert RGB image to Lab
 *
 * @param image UInt8 RGB (scaled by 1/255) or Float32 RGB in [0, 1]
 * @throws InvalidArgumentException if image is empty
 * @throws UnsupportedException if image is not 3-channel
 */
LOOKFORGE_API LabImage RgbToLab(const LImage& image);

/**
 * @brief Convert Lab buffer to Float32 RGB in [0, 1]
 *
 * No quantization takes place here.
 */
LOOKFORGE_API LImage LabToRgb(const LabImage& lab);

/**
 * @brief Clamp every pixel to L [0, 100], a/b [-128, 127]
 */
LOOKFORGE_API void ClampLab(LabImage& lab);

/**
 * @brief Quantize Float32 RGB to UInt8: round(clamp(v, 0, 1) * 255)
 */
LOOKFORGE_API LImage QuantizeToU8(const LImage& image);

} // namespace Look::Forge::Color
