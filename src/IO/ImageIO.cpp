/**
 * @file ImageIO.cpp
 * @brief Image file read/write
 */

#include <LookForge/IO/ImageIO.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Core/Validate.h>
#include <LookForge/Platform/FileIO.h>
#include <LookForge/Platform/Logger.h>

namespace Look::Forge::IO {

void ReadImage(const std::string& filename, LImage& image) {
    if (!Platform::FileExists(filename)) {
        throw IOException("file not found: " + filename);
    }
    image = LImage::FromFile(filename);
    Log::Debug("Read {}: {}x{}, {} channel(s)", filename, image.Width(), image.Height(),
               image.Channels());
}

LImage ReadRgbImage(const std::string& filename) {
    LImage image;
    ReadImage(filename, image);
    return image.ToRgb();
}

LImage ReadRgbImageFloat(const std::string& filename) {
    return ReadRgbImage(filename).ConvertTo(PixelType::Float32);
}

void WriteImage(const LImage& image, const std::string& filename) {
    Validate::RequireImageNonEmpty(image, "WriteImage");
    Validate::RequireImageType(image, PixelType::UInt8, "WriteImage");

    if (!Platform::EnsureParentDirectory(filename)) {
        throw IOException("cannot create directory for: " + filename);
    }
    if (!image.SaveToFile(filename)) {
        throw IOException("failed to write image: " + filename);
    }
    Log::Info("Image written: {} ({}x{})", filename, image.Width(), image.Height());
}

bool IsLossyFormat(const std::string& filename) {
    std::string ext = Platform::GetExtension(filename);
    return ext == ".jpg" || ext == ".jpeg";
}

} // namespace Look::Forge::IO
