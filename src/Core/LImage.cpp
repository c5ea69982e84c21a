#include <LookForge/Core/LImage.h>
#include <LookForge/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <new>
#include <vector>

// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Look::Forge {

namespace {

inline size_t AlignUp(size_t size, size_t alignment) {
    return (size + alignment - 1) & ~(alignment - 1);
}

struct AlignedDeleter {
    void operator()(uint8_t* ptr) const {
        ::operator delete(ptr, std::align_val_t(MEMORY_ALIGNMENT));
    }
};

int ChannelCount(ChannelType type) {
    switch (type) {
        case ChannelType::Gray: return 1;
        case ChannelType::RGB:  return 3;
        case ChannelType::RGBA: return 4;
    }
    return 1;
}

size_t ChannelSize(PixelType type) {
    return type == PixelType::Float32 ? sizeof(float) : sizeof(uint8_t);
}

} // namespace

// =============================================================================
// Implementation class
// =============================================================================

class LImage::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    PixelType type_ = PixelType::UInt8;
    ChannelType channelType_ = ChannelType::RGB;
    size_t stride_ = 0;
    std::shared_ptr<uint8_t> data_;

    size_t BytesPerPixel() const {
        return ChannelSize(type_) * ChannelCount(channelType_);
    }

    void Allocate(int32_t w, int32_t h) {
        width_ = w;
        height_ = h;

        stride_ = AlignUp(static_cast<size_t>(w) * BytesPerPixel(), MEMORY_ALIGNMENT);
        size_t totalSize = stride_ * static_cast<size_t>(h);

        auto* ptr = static_cast<uint8_t*>(
            ::operator new(totalSize, std::align_val_t(MEMORY_ALIGNMENT)));
        data_ = std::shared_ptr<uint8_t>(ptr, AlignedDeleter{});
        std::memset(ptr, 0, totalSize);
    }
};

// =============================================================================
// Constructors
// =============================================================================

LImage::LImage() : impl_(std::make_shared<Impl>()) {}

LImage::LImage(int32_t width, int32_t height, PixelType type, ChannelType channels)
    : impl_(std::make_shared<Impl>())
{
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive");
    }

    impl_->type_ = type;
    impl_->channelType_ = channels;
    impl_->Allocate(width, height);
}

LImage::LImage(const LImage& other) = default;
LImage::LImage(LImage&& other) noexcept = default;
LImage::~LImage() = default;
LImage& LImage::operator=(const LImage& other) = default;
LImage& LImage::operator=(LImage&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

LImage LImage::FromFile(const std::string& path) {
    int w, h, channels;
    uint8_t* data = stbi_load(path.c_str(), &w, &h, &channels, 0);

    if (!data) {
        const char* reason = stbi_failure_reason();
        throw IOException("Failed to load image: " + path +
                          (reason ? std::string(" (") + reason + ")" : std::string()));
    }

    ChannelType channelType;
    switch (channels) {
        case 1: channelType = ChannelType::Gray; break;
        case 2: channelType = ChannelType::Gray; break;  // gray + alpha, alpha dropped below
        case 3: channelType = ChannelType::RGB; break;
        case 4: channelType = ChannelType::RGBA; break;
        default:
            stbi_image_free(data);
            throw UnsupportedException("Unsupported channel count: " +
                                       std::to_string(channels));
    }

    LImage img;
    img.impl_->type_ = PixelType::UInt8;
    img.impl_->channelType_ = channelType;
    img.impl_->Allocate(w, h);

    // Copy row by row (handle stride)
    size_t srcStride = static_cast<size_t>(w) * channels;
    for (int32_t y = 0; y < h; ++y) {
        const uint8_t* src = data + y * srcStride;
        if (channels == 2) {
            uint8_t* dst = img.RowPtr(y);
            for (int32_t x = 0; x < w; ++x) {
                dst[x] = src[x * 2];
            }
        } else {
            std::memcpy(img.RowPtr(y), src, srcStride);
        }
    }

    stbi_image_free(data);
    return img;
}

LImage LImage::FromData(const void* data, int32_t width, int32_t height,
                        PixelType type, ChannelType channels) {
    LImage img(width, height, type, channels);

    size_t srcStride = static_cast<size_t>(width) * img.impl_->BytesPerPixel();
    const uint8_t* src = static_cast<const uint8_t*>(data);
    for (int32_t y = 0; y < height; ++y) {
        std::memcpy(img.RowPtr(y), src + y * srcStride, srcStride);
    }

    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t LImage::Width() const { return impl_->width_; }
int32_t LImage::Height() const { return impl_->height_; }
PixelType LImage::Type() const { return impl_->type_; }
ChannelType LImage::GetChannelType() const { return impl_->channelType_; }
size_t LImage::Stride() const { return impl_->stride_; }
bool LImage::Empty() const { return impl_->width_ == 0 || impl_->height_ == 0; }
bool LImage::IsValid() const { return impl_->data_ != nullptr && !Empty(); }
int LImage::Channels() const { return ChannelCount(impl_->channelType_); }

// =============================================================================
// Data Access
// =============================================================================

void* LImage::Data() { return impl_->data_.get(); }
const void* LImage::Data() const { return impl_->data_.get(); }

void* LImage::RowPtr(int32_t row) {
    return impl_->data_.get() + static_cast<size_t>(row) * impl_->stride_;
}

const void* LImage::RowPtr(int32_t row) const {
    return impl_->data_.get() + static_cast<size_t>(row) * impl_->stride_;
}

// =============================================================================
// Image Operations
// =============================================================================

LImage LImage::Clone() const {
    if (Empty()) {
        return LImage();
    }

    LImage copy(impl_->width_, impl_->height_, impl_->type_, impl_->channelType_);
    size_t rowBytes = static_cast<size_t>(impl_->width_) * impl_->BytesPerPixel();
    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(copy.RowPtr(y), RowPtr(y), rowBytes);
    }
    return copy;
}

bool LImage::SaveToFile(const std::string& path) const {
    if (Empty()) return false;

    // Encoders only take 8-bit data
    if (impl_->type_ != PixelType::UInt8) {
        return false;
    }

    int channels = Channels();
    int w = impl_->width_;
    int h = impl_->height_;

    // Create contiguous buffer
    size_t rowBytes = static_cast<size_t>(w) * channels;
    std::vector<uint8_t> buffer(rowBytes * h);
    for (int32_t y = 0; y < h; ++y) {
        std::memcpy(buffer.data() + y * rowBytes, RowPtr(y), rowBytes);
    }

    // Determine format from extension
    std::string ext;
    size_t dotPos = path.rfind('.');
    if (dotPos != std::string::npos) {
        ext = path.substr(dotPos);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    if (ext == ".jpg" || ext == ".jpeg") {
        return stbi_write_jpg(path.c_str(), w, h, channels, buffer.data(), 95) != 0;
    }
    if (ext == ".bmp") {
        return stbi_write_bmp(path.c_str(), w, h, channels, buffer.data()) != 0;
    }

    return stbi_write_png(path.c_str(), w, h, channels, buffer.data(),
                          static_cast<int>(rowBytes)) != 0;
}

LImage LImage::ConvertTo(PixelType targetType) const {
    if (Empty() || targetType == impl_->type_) {
        return Clone();
    }

    LImage out(impl_->width_, impl_->height_, targetType, impl_->channelType_);
    size_t valuesPerRow = static_cast<size_t>(impl_->width_) * Channels();

    for (int32_t y = 0; y < impl_->height_; ++y) {
        if (targetType == PixelType::Float32) {
            const uint8_t* src = static_cast<const uint8_t*>(RowPtr(y));
            float* dst = static_cast<float*>(out.RowPtr(y));
            for (size_t i = 0; i < valuesPerRow; ++i) {
                dst[i] = static_cast<float>(src[i] / 255.0);
            }
        } else {
            const float* src = static_cast<const float*>(RowPtr(y));
            uint8_t* dst = static_cast<uint8_t*>(out.RowPtr(y));
            for (size_t i = 0; i < valuesPerRow; ++i) {
                double v = std::min(1.0, std::max(0.0, static_cast<double>(src[i])));
                dst[i] = static_cast<uint8_t>(std::lround(v * 255.0));
            }
        }
    }

    return out;
}

LImage LImage::ToRgb() const {
    if (Empty() || impl_->channelType_ == ChannelType::RGB) {
        return *this;
    }

    LImage out(impl_->width_, impl_->height_, impl_->type_, ChannelType::RGB);
    int srcChannels = Channels();
    size_t valueSize = ChannelSize(impl_->type_);

    for (int32_t y = 0; y < impl_->height_; ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(RowPtr(y));
        uint8_t* dst = static_cast<uint8_t*>(out.RowPtr(y));
        for (int32_t x = 0; x < impl_->width_; ++x) {
            const uint8_t* px = src + static_cast<size_t>(x) * srcChannels * valueSize;
            uint8_t* outPx = dst + static_cast<size_t>(x) * 3 * valueSize;
            for (int c = 0; c < 3; ++c) {
                // Gray replicates channel 0; RGBA keeps the first three
                int srcC = (srcChannels == 1) ? 0 : c;
                std::memcpy(outPx + c * valueSize, px + srcC * valueSize, valueSize);
            }
        }
    }

    return out;
}

} // namespace Look::Forge
