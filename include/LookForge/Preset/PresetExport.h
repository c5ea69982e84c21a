#pragma once

/**
 * @file PresetExport.h
 * @brief Derive a preset from reference statistics and serialize it as XMP
 *
 * @code
 * auto preset = Preset::DerivePresetFromFile("ref.jpg");
 * Preset::WritePreset(preset, "look.xmp");
 * @endcode
 */

#include <LookForge/Color/ColorStatistics.h>
#include <LookForge/Core/Export.h>
#include <LookForge/Core/LImage.h>
#include <LookForge/Preset/Preset.h>

#include <string>

namespace Look::Forge::Preset {

// =============================================================================
// Parameter derivation
// =============================================================================

/**
 * @brief Basic tone from zone L means, global L spread and global a/b
 */
LOOKFORGE_API ToneParams ComputeToneParams(const Color::ZoneSet& zones,
                                           const Color::GlobalStats& global);

/**
 * @brief Split toning / color grading from the zone a/b means
 *
 * Hue is atan2(b, a) in degrees, [0, 360). Shadow and highlight saturation
 * are 1.5 |ab|, midtone 1.0 |ab|, clamped to [0, 100]; below 2 is dropped.
 */
LOOKFORGE_API SplitToningParams ComputeSplitToning(const Color::ZoneSet& zones);

/**
 * @brief HSL bucket adjustments from the HSV distribution of an RGB image
 *
 * Only pixels with saturation > 0.1 count; buckets with fewer than 100 such
 * pixels are left at 0.
 *
 * @param rgb UInt8 or Float32 RGB
 */
LOOKFORGE_API HslParams ComputeHslParams(const LImage& rgb);

/**
 * @brief Parametric curve, luminance curve and per-channel RGB curves
 */
LOOKFORGE_API CurveParams ComputeCurves(const Color::ZoneSet& zones);

/**
 * @brief Sharpening and noise reduction from the global L spread
 */
LOOKFORGE_API DetailParams ComputeDetailParams(const Color::GlobalStats& global);

/**
 * @brief Derive every preset section from a reference image
 *
 * @param reference Any decoded image (converted to RGB)
 * @param name Preset name
 * @param uuid Preset UUID; a random one is generated when empty
 */
LOOKFORGE_API Preset DerivePreset(const LImage& reference, const std::string& name,
                                  const std::string& uuid = std::string());

/**
 * @brief Load the reference, then DerivePreset
 *
 * An empty name becomes "Color Transfer from <file stem>".
 * @throws IOException if the reference cannot be read
 */
LOOKFORGE_API Preset DerivePresetFromFile(const std::string& referencePath,
                                          const std::string& name = std::string());

// =============================================================================
// Serialization
// =============================================================================

/**
 * @brief Render the preset as an XMP packet
 */
LOOKFORGE_API std::string FormatXmp(const Preset& preset);

/**
 * @brief Write the XMP packet (parent directories created)
 * @throws IOException on write failure
 */
LOOKFORGE_API void WritePreset(const Preset& preset, const std::string& path);

/// Escape &, <, >, " and ' for XML text and attribute content
LOOKFORGE_API std::string EscapeXml(const std::string& text);

} // namespace Look::Forge::Preset
