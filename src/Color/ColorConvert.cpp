/**
 * @file ColorConvert.cpp
 * @brief Color space conversion implementation
 */

#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Core/Constants.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Core/Validate.h>

#include <algorithm>
#include <cmath>

namespace Look::Forge::Color {

// =============================================================================
// Constants
// =============================================================================

namespace {

// sRGB to XYZ (D65) conversion matrix
constexpr double RGB_TO_XYZ[3][3] = {
    {0.4124564, 0.3575761, 0.1804375},
    {0.2126729, 0.7151522, 0.0721750},
    {0.0193339, 0.1191920, 0.9503041}
};

// XYZ to sRGB (D65) conversion matrix
constexpr double XYZ_TO_RGB[3][3] = {
    { 3.2404542, -1.5371385, -0.4985314},
    {-0.9692660,  1.8760108,  0.0415560},
    { 0.0556434, -0.2040259,  1.0572252}
};

// D65 white point
constexpr double D65_X = 0.95047;
constexpr double D65_Y = 1.00000;
constexpr double D65_Z = 1.08883;

// Lab constants
constexpr double LAB_EPSILON = 216.0 / 24389.0;   // (6/29)^3
constexpr double LAB_KAPPA = 24389.0 / 27.0;      // (29/3)^3

inline double Clamp(double val, double minVal, double maxVal) {
    return std::max(minVal, std::min(maxVal, val));
}

inline double SrgbToLinear(double val) {
    return (val <= 0.04045) ? val / 12.92 : std::pow((val + 0.055) / 1.055, 2.4);
}

inline double LinearToSrgb(double val) {
    return (val <= 0.0031308) ? val * 12.92 : 1.055 * std::pow(val, 1.0 / 2.4) - 0.055;
}

inline double LabF(double t) {
    return (t > LAB_EPSILON) ? std::cbrt(t) : (LAB_KAPPA * t + 16.0) / 116.0;
}

inline double LabFInv(double t) {
    double t3 = t * t * t;
    return (t3 > LAB_EPSILON) ? t3 : (116.0 * t - 16.0) / LAB_KAPPA;
}

// Read channel c of pixel x in an RGB row as a normalized double
inline double ReadNormalized(const LImage& image, const void* row, int32_t x, int c) {
    if (image.Type() == PixelType::UInt8) {
        return static_cast<const uint8_t*>(row)[x * 3 + c] / 255.0;
    }
    return static_cast<double>(static_cast<const float*>(row)[x * 3 + c]);
}

} // namespace

// =============================================================================
// RGB <-> Lab Conversion (CIE L*a*b*, D65 illuminant)
// =============================================================================

void RgbToLab(double r, double g, double b, double& L, double& a, double& labB) {
    double rLin = SrgbToLinear(r);
    double gLin = SrgbToLinear(g);
    double bLin = SrgbToLinear(b);

    double x = RGB_TO_XYZ[0][0] * rLin + RGB_TO_XYZ[0][1] * gLin + RGB_TO_XYZ[0][2] * bLin;
    double y = RGB_TO_XYZ[1][0] * rLin + RGB_TO_XYZ[1][1] * gLin + RGB_TO_XYZ[1][2] * bLin;
    double z = RGB_TO_XYZ[2][0] * rLin + RGB_TO_XYZ[2][1] * gLin + RGB_TO_XYZ[2][2] * bLin;

    double fx = LabF(x / D65_X);
    double fy = LabF(y / D65_Y);
    double fz = LabF(z / D65_Z);

    L = 116.0 * fy - 16.0;
    a = 500.0 * (fx - fy);
    labB = 200.0 * (fy - fz);
}

void LabToRgb(double L, double a, double labB, double& r, double& g, double& b) {
    double fy = (L + 16.0) / 116.0;
    double fx = a / 500.0 + fy;
    // Negative z has no physical meaning
    double fz = std::max(fy - labB / 200.0, 0.0);

    double x = LabFInv(fx) * D65_X;
    double y = LabFInv(fy) * D65_Y;
    double z = LabFInv(fz) * D65_Z;

    double rLin = XYZ_TO_RGB[0][0] * x + XYZ_TO_RGB[0][1] * y + XYZ_TO_RGB[0][2] * z;
    double gLin = XYZ_TO_RGB[1][0] * x + XYZ_TO_RGB[1][1] * y + XYZ_TO_RGB[1][2] * z;
    double bLin = XYZ_TO_RGB[2][0] * x + XYZ_TO_RGB[2][1] * y + XYZ_TO_RGB[2][2] * z;

    r = Clamp(LinearToSrgb(rLin), 0.0, 1.0);
    g = Clamp(LinearToSrgb(gLin), 0.0, 1.0);
    b = Clamp(LinearToSrgb(bLin), 0.0, 1.0);
}

// =============================================================================
// RGB -> HSV
// =============================================================================

void RgbToHsv(double r, double g, double b, double& h, double& s, double& v) {
    double maxVal = std::max(r, std::max(g, b));
    double minVal = std::min(r, std::min(g, b));
    double delta = maxVal - minVal;

    v = maxVal;
    s = (maxVal > 0.0) ? delta / maxVal : 0.0;

    if (delta <= 0.0) {
        h = 0.0;
        return;
    }

    // Ties resolve toward blue, then green
    double sector;
    if (b == maxVal) {
        sector = 4.0 + (r - g) / delta;
    } else if (g == maxVal) {
        sector = 2.0 + (b - r) / delta;
    } else {
        sector = (g - b) / delta;
    }

    h = std::fmod(sector * 60.0, 360.0);
    if (h < 0.0) h += 360.0;
}

// =============================================================================
// Image conversion
// =============================================================================

LabImage RgbToLab(const LImage& image) {
    Validate::RequireImageNonEmpty(image, "RgbToLab");
    Validate::RequireChannelCount(image, 3, "RgbToLab");

    const int32_t width = image.Width();
    const int32_t height = image.Height();
    LabImage lab(width, height);

    for (int32_t y = 0; y < height; ++y) {
        const void* row = image.RowPtr(y);
        for (int32_t x = 0; x < width; ++x) {
            RgbToLab(ReadNormalized(image, row, x, 0),
                     ReadNormalized(image, row, x, 1),
                     ReadNormalized(image, row, x, 2),
                     lab.At(x, y, 0), lab.At(x, y, 1), lab.At(x, y, 2));
        }
    }

    return lab;
}

LImage LabToRgb(const LabImage& lab) {
    if (lab.Empty()) {
        throw InvalidArgumentException("LabToRgb: Lab image is empty");
    }

    LImage out(lab.Width(), lab.Height(), PixelType::Float32, ChannelType::RGB);
    for (int32_t y = 0; y < lab.Height(); ++y) {
        float* row = static_cast<float*>(out.RowPtr(y));
        for (int32_t x = 0; x < lab.Width(); ++x) {
            double r, g, b;
            LabToRgb(lab.At(x, y, 0), lab.At(x, y, 1), lab.At(x, y, 2), r, g, b);
            row[x * 3 + 0] = static_cast<float>(r);
            row[x * 3 + 1] = static_cast<float>(g);
            row[x * 3 + 2] = static_cast<float>(b);
        }
    }

    return out;
}

void ClampLab(LabImage& lab) {
    std::vector<double>& values = lab.Values();
    for (size_t i = 0; i < values.size(); i += 3) {
        values[i] = Clamp(values[i], LAB_L_MIN, LAB_L_MAX);
        values[i + 1] = Clamp(values[i + 1], LAB_AB_MIN, LAB_AB_MAX);
        values[i + 2] = Clamp(values[i + 2], LAB_AB_MIN, LAB_AB_MAX);
    }
}

LImage QuantizeToU8(const LImage& image) {
    LOOKFORGE_REQUIRE_RGB_FLOAT(image);
    return image.ConvertTo(PixelType::UInt8);
}

} // namespace Look::Forge::Color
