#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for LookForge
 *
 * Layered API:
 * - RequireImageNonEmpty(): checks empty/valid (no type restriction)
 * - RequireImageType(): checks pixel type (UInt8, Float32)
 * - RequireChannelCount(): checks channel count (independent of type)
 * - Value checks: RequireRange(), RequirePositive(), RequireMin()
 */

#include <LookForge/Core/Export.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Core/LImage.h>

#include <cstdio>
#include <string>

namespace Look::Forge::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline const char* PixelTypeName(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return "UInt8";
        case PixelType::Float32: return "Float32";
    }
    return "Unknown";
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Check image is non-empty and valid
 * @throws InvalidArgumentException if image is empty or invalid
 */
inline void RequireImageNonEmpty(const LImage& image, const char* funcName) {
    if (image.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is empty");
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
}

/**
 * @brief Check image has specific pixel type
 * @throws UnsupportedException if type mismatch
 */
inline void RequireImageType(const LImage& image, PixelType expected, const char* funcName) {
    if (image.Type() != expected) {
        throw UnsupportedException(
            std::string(funcName) + ": expected " + Detail::PixelTypeName(expected) +
            " image, got " + Detail::PixelTypeName(image.Type()));
    }
}

/**
 * @brief Check image has exactly N channels
 * @throws UnsupportedException if channel count differs
 */
inline void RequireChannelCount(const LImage& image, int expected, const char* funcName) {
    int actual = image.Channels();
    if (actual != expected) {
        throw UnsupportedException(
            std::string(funcName) + ": expected " + std::to_string(expected) +
            " channel(s), got " + std::to_string(actual));
    }
}

/**
 * @brief Check image is non-empty, RGB, and of the given pixel type
 */
inline void RequireRgbImage(const LImage& image, PixelType expected, const char* funcName) {
    RequireImageNonEmpty(image, funcName);
    RequireImageType(image, expected, funcName);
    RequireChannelCount(image, 3, funcName);
}

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is in range [min, max]; NaN is rejected
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is at least minimum (>= min)
 */
template<typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (!(value >= minVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOOKFORGE_REQUIRE_RGB_U8(img) \
    ::Look::Forge::Validate::RequireRgbImage(img, ::Look::Forge::PixelType::UInt8, __func__)

#define LOOKFORGE_REQUIRE_RGB_FLOAT(img) \
    ::Look::Forge::Validate::RequireRgbImage(img, ::Look::Forge::PixelType::Float32, __func__)

} // namespace Look::Forge::Validate
