/**
 * @file PresetExport.cpp
 * @brief Preset derivation and XMP serialization
 */

#include <LookForge/Preset/PresetExport.h>
#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Core/Validate.h>
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Platform/FileIO.h>
#include <LookForge/Platform/Logger.h>
#include <LookForge/Platform/Random.h>

#include <algorithm>
#include <cmath>
#include <cstdio>

using Look::Forge::Color::LAB_A;
using Look::Forge::Color::LAB_B;
using Look::Forge::Color::LAB_L;

namespace Look::Forge::Preset {

namespace {

constexpr double PI = 3.14159265358979323846;

/// Tints weaker than this are not applied
constexpr double MIN_TINT_SATURATION = 2.0;

/// HSL bucket statistics
constexpr double HSL_MIN_SATURATION = 0.1;
constexpr int64_t HSL_MIN_PIXELS = 100;
constexpr double HSL_NEUTRAL_SATURATION = 0.45;
constexpr double HSL_NEUTRAL_VALUE = 0.5;

inline double Clamp(double val, double lo, double hi) {
    return std::max(lo, std::min(hi, val));
}

// Truncating conversion toward zero
inline int ToInt(double val) {
    return static_cast<int>(val);
}

double AbToHue(double a, double b) {
    double hue = std::atan2(b, a) * 180.0 / PI;
    if (hue < 0) hue += 360.0;
    return hue;
}

bool InRange(double hue, const HslRange& range) {
    if (range.lo > range.hi) {
        return hue >= range.lo || hue < range.hi;
    }
    return hue >= range.lo && hue < range.hi;
}

ToneCurve ChannelCurve(int shadowShift, int midShift, int highShift, int shadowMax, int highMax) {
    return {
        {0, 0},
        {25, std::max(0, std::min(shadowMax, 22 + shadowShift))},
        {128, std::max(80, std::min(175, 128 + midShift))},
        {200, std::max(160, std::min(highMax, 200 + highShift))},
        {255, 255},
    };
}

// =============================================================================
// XMP formatting helpers
// =============================================================================

std::string Signed(double value) {
    value += 0.0;   // -0.0 -> +0.0
    char buf[32];
    std::snprintf(buf, sizeof(buf), value >= 0 ? "+%.2f" : "%.2f", value);
    return buf;
}

std::string Fixed1(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

void Attr(std::string& out, const std::string& key, const std::string& value) {
    out += "    crs:" + key + "=\"" + value + "\"\n";
}

void Attr(std::string& out, const std::string& key, int value) {
    Attr(out, key, std::to_string(value));
}

void EmptyAlt(std::string& out, const char* tag) {
    out += std::string("   <crs:") + tag + ">\n";
    out += "    <rdf:Alt>\n";
    out += "     <rdf:li xml:lang=\"x-default\"/>\n";
    out += "    </rdf:Alt>\n";
    out += std::string("   </crs:") + tag + ">\n";
}

void CurveSeq(std::string& out, const std::string& tag, const ToneCurve& curve) {
    out += "   <crs:" + tag + ">\n";
    out += "    <rdf:Seq>\n";
    for (const auto& pt : curve) {
        out += "     <rdf:li>" + std::to_string(pt.x) + ", " + std::to_string(pt.y) + "</rdf:li>\n";
    }
    out += "    </rdf:Seq>\n";
    out += "   </crs:" + tag + ">\n";
}

} // namespace

// =============================================================================
// Derivation
// =============================================================================

ToneParams ComputeToneParams(const Color::ZoneSet& zones, const Color::GlobalStats& global) {
    const double midL = zones.midtones[LAB_L].mean;
    const double shadowL = zones.shadows[LAB_L].mean;
    const double highlightL = zones.highlights[LAB_L].mean;
    const double globalLStd = global[LAB_L].stddev;

    ToneParams tone;
    tone.exposure = Clamp((midL - 50.0) / 50.0 * 0.6, -5.0, 5.0);
    tone.contrast = Clamp((highlightL - shadowL - 50.0) / 30.0 * 30.0, -100.0, 100.0);
    tone.highlights = Clamp((highlightL - 80.0) / 20.0 * -40.0, -100.0, 100.0);
    tone.shadows = Clamp((shadowL - 15.0) / 15.0 * 40.0, -100.0, 100.0);
    tone.whites = Clamp(tone.highlights * 0.4, -100.0, 100.0);
    tone.blacks = Clamp(tone.shadows * 0.6, -100.0, 100.0);
    tone.clarity = Clamp((globalLStd - 20.0) / 15.0 * 25.0, -100.0, 100.0);
    tone.dehaze = Clamp(tone.clarity * 0.5, -100.0, 100.0);
    tone.texture = Clamp(tone.clarity * 0.2, -100.0, 100.0);

    double abMagnitude = std::hypot(global[LAB_A].mean, global[LAB_B].mean);
    tone.vibrance = Clamp(abMagnitude * 4.0, 0.0, 100.0);
    tone.saturation = Clamp(tone.vibrance * 0.05, -10.0, 10.0);
    return tone;
}

SplitToningParams ComputeSplitToning(const Color::ZoneSet& zones) {
    auto tint = [](const Color::ZoneStats& zone, double gain, int& hue, int& saturation) {
        double a = zone[LAB_A].mean;
        double b = zone[LAB_B].mean;
        double sat = Clamp(std::hypot(a, b) * gain, 0.0, 100.0);
        if (sat < MIN_TINT_SATURATION) {
            sat = 0;
        }
        hue = ToInt(AbToHue(a, b));
        saturation = ToInt(sat);
    };

    SplitToningParams st;
    tint(zones.shadows, 1.5, st.shadowHue, st.shadowSaturation);
    tint(zones.highlights, 1.5, st.highlightHue, st.highlightSaturation);
    tint(zones.midtones, 1.0, st.midtoneHue, st.midtoneSaturation);
    return st;
}

HslParams ComputeHslParams(const LImage& rgb) {
    Validate::RequireImageNonEmpty(rgb, "ComputeHslParams");
    Validate::RequireChannelCount(rgb, 3, "ComputeHslParams");

    const bool isFloat = rgb.Type() == PixelType::Float32;
    double sumS[HSL_COLOR_COUNT] = {};
    double sumV[HSL_COLOR_COUNT] = {};
    int64_t count[HSL_COLOR_COUNT] = {};

    for (int32_t y = 0; y < rgb.Height(); ++y) {
        const void* row = rgb.RowPtr(y);
        for (int32_t x = 0; x < rgb.Width(); ++x) {
            double px[3];
            for (int c = 0; c < 3; ++c) {
                px[c] = isFloat ? static_cast<const float*>(row)[x * 3 + c]
                                : static_cast<const uint8_t*>(row)[x * 3 + c] / 255.0;
            }

            double h, s, v;
            Color::RgbToHsv(px[0], px[1], px[2], h, s, v);
            if (s <= HSL_MIN_SATURATION) continue;

            for (int k = 0; k < HSL_COLOR_COUNT; ++k) {
                if (InRange(h, HSL_RANGES[k])) {
                    sumS[k] += s;
                    sumV[k] += v;
                    ++count[k];
                    break;
                }
            }
        }
    }

    HslParams hsl;
    for (int k = 0; k < HSL_COLOR_COUNT; ++k) {
        if (count[k] < HSL_MIN_PIXELS) continue;
        double avgS = sumS[k] / static_cast<double>(count[k]);
        double avgV = sumV[k] / static_cast<double>(count[k]);
        hsl.saturation[k] = ToInt(Clamp((avgS - HSL_NEUTRAL_SATURATION) * 30.0, -20.0, 20.0));
        hsl.luminance[k] = ToInt(Clamp((avgV - HSL_NEUTRAL_VALUE) * 30.0, -20.0, 25.0));
        hsl.hue[k] = 0;
    }
    return hsl;
}

CurveParams ComputeCurves(const Color::ZoneSet& zones) {
    const double shadowL = zones.shadows[LAB_L].mean;
    const double highlightL = zones.highlights[LAB_L].mean;

    CurveParams curves;
    curves.parametric.shadows = ToInt(Clamp((shadowL - 15.0) * 0.8, -50.0, 50.0));
    curves.parametric.darks = ToInt(Clamp((shadowL - 20.0) * 1.0, -50.0, 50.0));
    curves.parametric.lights = ToInt(Clamp((highlightL - 80.0) * -0.6, -50.0, 50.0));
    curves.parametric.highlights = ToInt(Clamp((highlightL - 85.0) * -0.4, -50.0, 50.0));

    int shadowLift = std::max(0, ToInt((shadowL - 10.0) * 0.5));
    curves.luminance = {{0, 0}, {63, std::min(80, 56 + shadowLift)}, {141, 141}, {255, 255}};

    const double sa = zones.shadows[LAB_A].mean;
    const double sb = zones.shadows[LAB_B].mean;
    const double ma = zones.midtones[LAB_A].mean;
    const double mb = zones.midtones[LAB_B].mean;
    const double ha = zones.highlights[LAB_A].mean;
    const double hb = zones.highlights[LAB_B].mean;

    // +a is red/magenta, +b is yellow
    curves.red = ChannelCurve(ToInt(Clamp(sa * 0.12 + sb * 0.05, -12.0, 12.0)),
                              ToInt(Clamp(ma * 0.08 + mb * 0.03, -8.0, 8.0)),
                              ToInt(Clamp(ha * 0.10 + hb * 0.04, -10.0, 10.0)),
                              40, 240);

    // -a is green
    curves.green = ChannelCurve(ToInt(Clamp(-sa * 0.10, -10.0, 10.0)),
                                ToInt(Clamp(-ma * 0.06, -6.0, 6.0)),
                                ToInt(Clamp(-ha * 0.08, -8.0, 8.0)),
                                40, 240);

    // -b is blue, -a adds cyan
    curves.blue = ChannelCurve(ToInt(Clamp(-sb * 0.15 - sa * 0.05, -15.0, 15.0)),
                               ToInt(Clamp(-mb * 0.08, -8.0, 8.0)),
                               ToInt(Clamp(-hb * 0.12 - ha * 0.04, -12.0, 12.0)),
                               45, 245);
    return curves;
}

DetailParams ComputeDetailParams(const Color::GlobalStats& global) {
    double clarityFactor = (global[LAB_L].stddev - 20.0) / 15.0;

    DetailParams detail;
    detail.sharpness = ToInt(Clamp(12.0 + clarityFactor * 8.0, 0.0, 80.0));
    detail.luminanceSmoothing = ToInt(Clamp(5.0 - clarityFactor * 2.0, 0.0, 50.0));
    return detail;
}

Preset DerivePreset(const LImage& reference, const std::string& name, const std::string& uuid) {
    Validate::RequireImageNonEmpty(reference, "DerivePreset");

    LImage rgb = reference.ToRgb();
    LabImage lab = Color::RgbToLab(rgb);
    Color::LookStatistics stats = Color::ExtractStatistics(lab);

    Preset preset;
    preset.name = name;
    preset.uuid = uuid.empty() ? Platform::Random::Instance().Uuid4(true, false) : uuid;
    preset.tone = ComputeToneParams(stats.zones, stats.global);
    preset.splitToning = ComputeSplitToning(stats.zones);
    preset.hsl = ComputeHslParams(rgb);
    preset.curves = ComputeCurves(stats.zones);
    preset.detail = ComputeDetailParams(stats.global);

    Log::Debug("Preset '{}': exposure {:+.2f}, contrast {:+.2f}, shadow tint {}/{}, highlight tint {}/{}",
               preset.name, preset.tone.exposure, preset.tone.contrast,
               preset.splitToning.shadowHue, preset.splitToning.shadowSaturation,
               preset.splitToning.highlightHue, preset.splitToning.highlightSaturation);
    return preset;
}

Preset DerivePresetFromFile(const std::string& referencePath, const std::string& name) {
    LImage reference = IO::ReadRgbImage(referencePath);
    std::string presetName = name.empty()
        ? "Color Transfer from " + Platform::GetStem(referencePath)
        : name;
    return DerivePreset(reference, presetName);
}

// =============================================================================
// Serialization
// =============================================================================

std::string EscapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += ch; break;
        }
    }
    return out;
}

std::string FormatXmp(const Preset& preset) {
    const ToneParams& tone = preset.tone;
    const ParametricCurve& para = preset.curves.parametric;
    const DetailParams& detail = preset.detail;
    const SplitToningParams& st = preset.splitToning;

    std::string out;
    out.reserve(8192);

    out += "<?xpacket begin=\"\xEF\xBB\xBF\" id=\"W5M0MpCehiHzreSzNTczkc9d\"?>\n";
    out += "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\" "
           "x:xmptk=\"Adobe XMP Core 7.0-c000 1.000000, 0000/00/00-00:00:00        \">\n";
    out += " <rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\">\n";
    out += "  <rdf:Description rdf:about=\"\"\n";
    out += "    xmlns:crs=\"http://ns.adobe.com/camera-raw-settings/1.0/\"\n";

    // Metadata and capability flags
    Attr(out, "PresetType", "Normal");
    Attr(out, "Cluster", "");
    Attr(out, "UUID", EscapeXml(preset.uuid));
    Attr(out, "SupportsAmount", "False");
    Attr(out, "SupportsColor", "True");
    Attr(out, "SupportsMonochrome", "True");
    Attr(out, "SupportsHighDynamicRange", "True");
    Attr(out, "SupportsNormalDynamicRange", "True");
    Attr(out, "SupportsSceneReferred", "True");
    Attr(out, "SupportsOutputReferred", "True");
    Attr(out, "RequiresRGBTables", "False");
    Attr(out, "ShowInPresets", "True");
    Attr(out, "ShowInQuickActions", "False");
    Attr(out, "CameraModelRestriction", "");
    Attr(out, "Copyright", "");
    Attr(out, "ContactInfo", "");
    Attr(out, "Version", "18.1");
    Attr(out, "CompatibleVersion", "285212672");
    Attr(out, "ProcessVersion", "15.4");
    Attr(out, "WhiteBalance", "As Shot");

    // Basic tone
    Attr(out, "Exposure2012", Signed(tone.exposure));
    Attr(out, "Contrast2012", Signed(tone.contrast));
    Attr(out, "Highlights2012", Signed(tone.highlights));
    Attr(out, "Shadows2012", Signed(tone.shadows));
    Attr(out, "Whites2012", Signed(tone.whites));
    Attr(out, "Blacks2012", Signed(tone.blacks));
    Attr(out, "Texture", ToInt(tone.texture));
    Attr(out, "Clarity2012", Signed(tone.clarity));
    Attr(out, "Dehaze", Signed(tone.dehaze));
    Attr(out, "Vibrance", Signed(tone.vibrance));
    Attr(out, "Saturation", ToInt(tone.saturation));

    // Parametric curve
    Attr(out, "ParametricShadows", para.shadows);
    Attr(out, "ParametricDarks", para.darks);
    Attr(out, "ParametricLights", para.lights);
    Attr(out, "ParametricHighlights", para.highlights);
    Attr(out, "ParametricShadowSplit", para.shadowSplit);
    Attr(out, "ParametricMidtoneSplit", para.midtoneSplit);
    Attr(out, "ParametricHighlightSplit", para.highlightSplit);

    // Detail
    Attr(out, "Sharpness", detail.sharpness);
    Attr(out, "SharpenRadius", Fixed1(detail.sharpenRadius));
    Attr(out, "SharpenDetail", detail.sharpenDetail);
    Attr(out, "SharpenEdgeMasking", detail.sharpenEdgeMasking);
    Attr(out, "LuminanceSmoothing", detail.luminanceSmoothing);
    Attr(out, "LuminanceNoiseReductionDetail", detail.luminanceNoiseReductionDetail);
    Attr(out, "LuminanceNoiseReductionContrast", detail.luminanceNoiseReductionContrast);
    Attr(out, "ColorNoiseReduction", detail.colorNoiseReduction);
    Attr(out, "ColorNoiseReductionDetail", detail.colorNoiseReductionDetail);
    Attr(out, "ColorNoiseReductionSmoothness", detail.colorNoiseReductionSmoothness);

    // HSL
    for (int k = 0; k < HSL_COLOR_COUNT; ++k) {
        Attr(out, std::string("HueAdjustment") + HSL_RANGES[k].name, preset.hsl.hue[k]);
    }
    for (int k = 0; k < HSL_COLOR_COUNT; ++k) {
        Attr(out, std::string("SaturationAdjustment") + HSL_RANGES[k].name, preset.hsl.saturation[k]);
    }
    for (int k = 0; k < HSL_COLOR_COUNT; ++k) {
        Attr(out, std::string("LuminanceAdjustment") + HSL_RANGES[k].name, preset.hsl.luminance[k]);
    }

    // Split toning / color grading
    Attr(out, "SplitToningShadowHue", st.shadowHue);
    Attr(out, "SplitToningShadowSaturation", st.shadowSaturation);
    Attr(out, "SplitToningHighlightHue", st.highlightHue);
    Attr(out, "SplitToningHighlightSaturation", st.highlightSaturation);
    Attr(out, "SplitToningBalance", st.balance);
    Attr(out, "ColorGradeMidtoneHue", st.midtoneHue);
    Attr(out, "ColorGradeMidtoneSat", st.midtoneSaturation);
    Attr(out, "ColorGradeShadowLum", st.shadowLum);
    Attr(out, "ColorGradeMidtoneLum", st.midtoneLum);
    Attr(out, "ColorGradeHighlightLum", st.highlightLum);
    Attr(out, "ColorGradeBlending", st.blending);
    Attr(out, "ColorGradeGlobalHue", st.globalHue);
    Attr(out, "ColorGradeGlobalSat", st.globalSat);
    Attr(out, "ColorGradeGlobalLum", st.globalLum);

    // Fixed settings
    Attr(out, "PerspectiveUpright", "0");
    Attr(out, "PerspectiveVertical", "0");
    Attr(out, "PerspectiveHorizontal", "0");
    Attr(out, "PerspectiveRotate", "0.0");
    Attr(out, "PerspectiveAspect", "0");
    Attr(out, "PerspectiveScale", "100");
    Attr(out, "PerspectiveX", "0.00");
    Attr(out, "PerspectiveY", "0.00");
    Attr(out, "ShadowTint", "0");
    Attr(out, "RedHue", "0");
    Attr(out, "RedSaturation", "0");
    Attr(out, "GreenHue", "0");
    Attr(out, "GreenSaturation", "0");
    Attr(out, "BlueHue", "0");
    Attr(out, "BlueSaturation", "0");
    Attr(out, "HDREditMode", "0");
    Attr(out, "CurveRefineSaturation", "100");
    Attr(out, "ConvertToGrayscale", "False");
    Attr(out, "ToneCurveName2012", "Custom");
    Attr(out, "AllowFilters", "1");
    Attr(out, "HasSettings", "True");
    Attr(out, "CropConstrainToWarp", "0");
    out += "   >\n";

    out += "   <crs:Name>\n";
    out += "    <rdf:Alt>\n";
    out += "     <rdf:li xml:lang=\"x-default\">" + EscapeXml(preset.name) + "</rdf:li>\n";
    out += "    </rdf:Alt>\n";
    out += "   </crs:Name>\n";

    EmptyAlt(out, "ShortName");
    EmptyAlt(out, "SortName");
    EmptyAlt(out, "Group");
    EmptyAlt(out, "Description");

    CurveSeq(out, "ToneCurvePV2012", preset.curves.luminance);
    CurveSeq(out, "ToneCurvePV2012Red", preset.curves.red);
    CurveSeq(out, "ToneCurvePV2012Green", preset.curves.green);
    CurveSeq(out, "ToneCurvePV2012Blue", preset.curves.blue);

    out += "  </rdf:Description>\n";
    out += " </rdf:RDF>\n";
    out += "</x:xmpmeta>\n";
    out += "<?xpacket end=\"w\"?>";

    return out;
}

void WritePreset(const Preset& preset, const std::string& path) {
    std::string xmp = FormatXmp(preset);
    if (!Platform::WriteTextFile(path, xmp)) {
        throw IOException("failed to write preset file: " + path);
    }
    Log::Info("Preset written: {}", path);
}

} // namespace Look::Forge::Preset
