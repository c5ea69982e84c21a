#pragma once

/**
 * @file ImageIO.h
 * @brief Image file read/write at the library boundary
 *
 * Decoding and encoding go through stb_image / stb_image_write.
 * Readable: PNG, JPEG, BMP, TGA, GIF (first frame), PSD, PNM
 * Writable: PNG (default), JPEG (quality 95), BMP
 */

#include <LookForge/Core/LImage.h>
#include <LookForge/Core/Export.h>

#include <string>

namespace Look::Forge::IO {

// =============================================================================
// Image Read Functions
// =============================================================================

/**
 * @brief Read image from file with its native channel layout
 *
 * @param filename Input file path
 * @param[out] image Loaded UInt8 image (Gray, RGB or RGBA)
 * @throws IOException if the file is missing or cannot be decoded
 */
LOOKFORGE_API void ReadImage(const std::string& filename, LImage& image);

/**
 * @brief Read image and convert to UInt8 RGB (gray replicated, alpha dropped)
 * @throws IOException if the file is missing or cannot be decoded
 */
LOOKFORGE_API LImage ReadRgbImage(const std::string& filename);

/**
 * @brief Read image as Float32 RGB normalized to [0, 1]
 * @throws IOException if the file is missing or cannot be decoded
 */
LOOKFORGE_API LImage ReadRgbImageFloat(const std::string& filename);

// =============================================================================
// Image Write Functions
// =============================================================================

/**
 * @brief Write UInt8 image; parent directories are created
 *
 * @throws UnsupportedException if the image is not UInt8
 * @throws IOException if encoding or writing fails
 */
LOOKFORGE_API void WriteImage(const LImage& image, const std::string& filename);

/// True for extensions whose encoder is lossy (.jpg, .jpeg)
LOOKFORGE_API bool IsLossyFormat(const std::string& filename);

} // namespace Look::Forge::IO
