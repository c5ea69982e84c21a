#pragma once

/**
 * @file HaldClut.h
 * @brief Hald CLUT images: a 3D LUT stored as a square 8-bit image
 *
 * A Hald image of level L is L^3 x L^3 pixels and encodes a LUT with
 * N = L^2 nodes per axis. Flat pixel i holds node
 * (i % N, (i / N) % N, i / N^2). Level 8 gives 512x512 (64^3 LUT),
 * level 12 gives 1728x1728 (144^3 LUT).
 */

#include <LookForge/Core/Export.h>
#include <LookForge/Core/LImage.h>
#include <LookForge/Lut/Lut3D.h>

#include <cstdint>
#include <string>

namespace Look::Forge::Lut {

/// Supported identity levels
constexpr int32_t HALD_LEVEL_8 = 8;
constexpr int32_t HALD_LEVEL_12 = 12;

/**
 * @brief Identity Hald image, pixel value round(idx * 255 / (N-1))
 * @throws InvalidArgumentException if level is not 8 or 12
 */
LOOKFORGE_API LImage GenerateHaldIdentity(int32_t level = HALD_LEVEL_8);

/**
 * @brief Hald level for an image side length
 * @throws FormatException if side is not a perfect cube of an integer >= 2
 */
LOOKFORGE_API int32_t HaldLevelFromSide(int32_t side);

/**
 * @brief Decode a (processed) Hald image into a LUT, values / 255
 *
 * @throws FormatException if the image is not square or its side is not a
 *         perfect cube
 */
LOOKFORGE_API Lut3D HaldToLut(const LImage& hald);

/**
 * @brief Encode a LUT as a Hald image, round(clamp(v, 0, 1) * 255)
 * @throws FormatException if the LUT size is not a perfect square
 */
LOOKFORGE_API LImage LutToHald(const Lut3D& lut);

/**
 * @brief Read a Hald image file and decode it
 *
 * Logs a warning for lossy (JPEG) inputs.
 */
LOOKFORGE_API Lut3D ReadHald(const std::string& path);

/**
 * @brief Write a Hald image
 *
 * Logs a warning when the extension selects a lossy encoder.
 */
LOOKFORGE_API void WriteHald(const LImage& hald, const std::string& path);

} // namespace Look::Forge::Lut
