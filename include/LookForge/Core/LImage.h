#pragma once

/**
 * @file LImage.h
 * @brief Reference-counted image container
 */

#include <LookForge/Core/Types.h>
#include <LookForge/Core/Constants.h>

#include <memory>
#include <string>

namespace Look::Forge {

/**
 * @brief Image class used at every API boundary
 *
 * Key features:
 * - UInt8 pixels for decoded/encoded files, Float32 for normalized RGB in [0, 1]
 * - Gray, RGB and RGBA layouts (interleaved)
 * - 64-byte row alignment
 * - Shallow copy by default, Clone() for deep copy
 */
class LImage {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    LImage();

    /// Create zero-filled image with specified dimensions and type
    LImage(int32_t width, int32_t height,
           PixelType type = PixelType::UInt8,
           ChannelType channels = ChannelType::RGB);

    /// Copy constructor (shallow copy)
    LImage(const LImage& other);

    /// Move constructor
    LImage(LImage&& other) noexcept;

    /// Destructor
    ~LImage();

    /// Copy assignment (shallow copy)
    LImage& operator=(const LImage& other);

    /// Move assignment
    LImage& operator=(LImage&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Load image from file (PNG, JPEG, BMP, TGA, ...)
     * @throws IOException if the file cannot be decoded
     */
    static LImage FromFile(const std::string& path);

    /// Create from tightly packed raw data (copies data)
    static LImage FromData(const void* data, int32_t width, int32_t height,
                           PixelType type = PixelType::UInt8,
                           ChannelType channels = ChannelType::RGB);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    /// Image width in pixels
    int32_t Width() const;

    /// Image height in pixels
    int32_t Height() const;

    /// Number of channels
    int Channels() const;

    /// Pixel type
    PixelType Type() const;

    /// Channel type
    ChannelType GetChannelType() const;

    /// Row stride in bytes (includes alignment padding)
    size_t Stride() const;

    /// Check if image is empty
    bool Empty() const;

    /// Check if image is valid (allocated)
    bool IsValid() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get pointer to raw data
    void* Data();
    const void* Data() const;

    /// Get pointer to specific row
    void* RowPtr(int32_t row);
    const void* RowPtr(int32_t row) const;

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    LImage Clone() const;

    /**
     * @brief Save UInt8 image to file, format chosen by extension
     *
     * .png, .jpg/.jpeg and .bmp are recognized; anything else is written as PNG.
     * @return false if the image is empty, not UInt8, or the encoder failed
     */
    bool SaveToFile(const std::string& path) const;

    /**
     * @brief Convert to a different pixel type
     *
     * UInt8 -> Float32 divides by 255; Float32 -> UInt8 clamps to [0, 1],
     * scales by 255 and rounds to nearest.
     */
    LImage ConvertTo(PixelType targetType) const;

    /// Convert Gray/RGBA to RGB (alpha dropped, gray replicated); RGB is shared
    LImage ToRgb() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Look::Forge
