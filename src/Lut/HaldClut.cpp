/**
 * @file HaldClut.cpp
 * @brief Hald CLUT encode/decode
 */

#include <LookForge/Lut/HaldClut.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Core/Validate.h>
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Platform/Logger.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace Look::Forge::Lut {

namespace {

void WarnIfLossy(const std::string& path) {
    if (IO::IsLossyFormat(path)) {
        Log::Warn("Hald CLUT {} uses a lossy format; JPEG artifacts will corrupt the LUT, "
                  "use PNG", path);
    }
}

} // namespace

LImage GenerateHaldIdentity(int32_t level) {
    if (level != HALD_LEVEL_8 && level != HALD_LEVEL_12) {
        throw InvalidArgumentException("GenerateHaldIdentity: level must be 8 or 12, got " +
                                       std::to_string(level));
    }

    const int32_t n = level * level;
    const int32_t side = level * level * level;
    const double scale = 255.0 / (n - 1);

    LImage hald(side, side, PixelType::UInt8, ChannelType::RGB);
    for (int32_t y = 0; y < side; ++y) {
        uint8_t* row = static_cast<uint8_t*>(hald.RowPtr(y));
        for (int32_t x = 0; x < side; ++x) {
            int64_t i = static_cast<int64_t>(y) * side + x;
            int64_t r = i % n;
            int64_t g = (i / n) % n;
            int64_t b = i / (static_cast<int64_t>(n) * n);
            row[x * 3 + 0] = static_cast<uint8_t>(std::lround(r * scale));
            row[x * 3 + 1] = static_cast<uint8_t>(std::lround(g * scale));
            row[x * 3 + 2] = static_cast<uint8_t>(std::lround(b * scale));
        }
    }

    return hald;
}

int32_t HaldLevelFromSide(int32_t side) {
    int32_t level = static_cast<int32_t>(std::lround(std::cbrt(static_cast<double>(side))));
    if (level < 2 || static_cast<int64_t>(level) * level * level != side) {
        throw FormatException("image size " + std::to_string(side) +
                              " is not a perfect cube, not a valid Hald CLUT");
    }
    return level;
}

Lut3D HaldToLut(const LImage& hald) {
    Validate::RequireImageNonEmpty(hald, "HaldToLut");
    if (hald.Width() != hald.Height()) {
        throw FormatException("Hald image must be square, got " +
                              std::to_string(hald.Width()) + "x" + std::to_string(hald.Height()));
    }

    const int32_t side = hald.Width();
    const int32_t level = HaldLevelFromSide(side);
    const int32_t n = level * level;

    LImage rgb = hald.ToRgb();
    const bool isFloat = rgb.Type() == PixelType::Float32;

    Lut3D lut(n);
    for (int32_t y = 0; y < side; ++y) {
        const void* row = rgb.RowPtr(y);
        for (int32_t x = 0; x < side; ++x) {
            int64_t i = static_cast<int64_t>(y) * side + x;
            double v[3];
            for (int c = 0; c < 3; ++c) {
                v[c] = isFloat ? static_cast<const float*>(row)[x * 3 + c]
                               : static_cast<const uint8_t*>(row)[x * 3 + c] / 255.0;
            }
            lut.Set(static_cast<int32_t>(i % n),
                    static_cast<int32_t>((i / n) % n),
                    static_cast<int32_t>(i / (static_cast<int64_t>(n) * n)),
                    v[0], v[1], v[2]);
        }
    }

    Log::Debug("Hald decoded: level {}, LUT size {}", level, n);
    return lut;
}

LImage LutToHald(const Lut3D& lut) {
    if (lut.Empty()) {
        throw InvalidArgumentException("LutToHald: LUT is empty");
    }

    const int32_t n = lut.Size();
    const int32_t level = static_cast<int32_t>(std::lround(std::sqrt(static_cast<double>(n))));
    if (level * level != n) {
        throw FormatException("LUT size " + std::to_string(n) +
                              " is not a perfect square; Hald export needs level^2 nodes "
                              "(e.g. 64 = 8^2, 144 = 12^2)");
    }

    const int32_t side = level * level * level;
    LImage hald(side, side, PixelType::UInt8, ChannelType::RGB);
    for (int32_t y = 0; y < side; ++y) {
        uint8_t* row = static_cast<uint8_t*>(hald.RowPtr(y));
        for (int32_t x = 0; x < side; ++x) {
            int64_t i = static_cast<int64_t>(y) * side + x;
            int32_t r = static_cast<int32_t>(i % n);
            int32_t g = static_cast<int32_t>((i / n) % n);
            int32_t b = static_cast<int32_t>(i / (static_cast<int64_t>(n) * n));
            for (int c = 0; c < 3; ++c) {
                double v = std::clamp(lut.At(r, g, b, c), 0.0, 1.0);
                row[x * 3 + c] = static_cast<uint8_t>(std::lround(v * 255.0));
            }
        }
    }

    return hald;
}

Lut3D ReadHald(const std::string& path) {
    WarnIfLossy(path);
    LImage image;
    IO::ReadImage(path, image);
    return HaldToLut(image);
}

void WriteHald(const LImage& hald, const std::string& path) {
    WarnIfLossy(path);
    IO::WriteImage(hald, path);
}

} // namespace Look::Forge::Lut
