/**
 * @file test_limage.cpp
 * @brief Unit tests for Core/LImage.h and IO/ImageIO.h
 */

#include <gtest/gtest.h>
#include <LookForge/Core/LImage.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Platform/FileIO.h>

#include <stb/stb_image_write.h>

#include <cstdint>
#include <cstring>

using namespace Look::Forge;

// =============================================================================
// Construction
// =============================================================================

TEST(LImageTest, DefaultIsEmpty) {
    LImage img;
    EXPECT_TRUE(img.Empty());
    EXPECT_FALSE(img.IsValid());
    EXPECT_EQ(img.Width(), 0);
    EXPECT_EQ(img.Height(), 0);
}

TEST(LImageTest, CreateRgbU8) {
    LImage img(10, 5);
    EXPECT_FALSE(img.Empty());
    EXPECT_EQ(img.Width(), 10);
    EXPECT_EQ(img.Height(), 5);
    EXPECT_EQ(img.Channels(), 3);
    EXPECT_EQ(img.Type(), PixelType::UInt8);
    EXPECT_GE(img.Stride(), 30u);
    EXPECT_EQ(img.Stride() % MEMORY_ALIGNMENT, 0u);

    const uint8_t* row = static_cast<const uint8_t*>(img.RowPtr(4));
    for (int i = 0; i < 30; ++i) {
        EXPECT_EQ(row[i], 0);
    }
}

TEST(LImageTest, CreateFloatGray) {
    LImage img(4, 4, PixelType::Float32, ChannelType::Gray);
    EXPECT_EQ(img.Channels(), 1);
    EXPECT_EQ(img.Type(), PixelType::Float32);
    EXPECT_EQ(img.GetChannelType(), ChannelType::Gray);
}

TEST(LImageTest, ShallowCopySharesData) {
    LImage a(2, 2);
    LImage b = a;
    static_cast<uint8_t*>(b.Data())[0] = 42;
    EXPECT_EQ(static_cast<const uint8_t*>(a.Data())[0], 42);
}

TEST(LImageTest, CloneIsDeep) {
    LImage a(2, 2);
    LImage b = a.Clone();
    static_cast<uint8_t*>(b.Data())[0] = 42;
    EXPECT_EQ(static_cast<const uint8_t*>(a.Data())[0], 0);
}

TEST(LImageTest, FromDataCopiesRows) {
    uint8_t data[2 * 2 * 3] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    LImage img = LImage::FromData(data, 2, 2);
    const uint8_t* row1 = static_cast<const uint8_t*>(img.RowPtr(1));
    EXPECT_EQ(row1[0], 7);
    EXPECT_EQ(row1[5], 12);
}

// =============================================================================
// Conversion
// =============================================================================

TEST(LImageTest, ConvertU8ToFloat) {
    uint8_t data[3] = {0, 51, 255};
    LImage img = LImage::FromData(data, 1, 1);
    LImage f = img.ConvertTo(PixelType::Float32);
    const float* px = static_cast<const float*>(f.Data());
    EXPECT_FLOAT_EQ(px[0], 0.0f);
    EXPECT_FLOAT_EQ(px[1], 0.2f);
    EXPECT_FLOAT_EQ(px[2], 1.0f);
}

TEST(LImageTest, ConvertFloatToU8RoundsAndClamps) {
    float data[3] = {-0.5f, 0.5f, 1.5f};
    LImage img = LImage::FromData(data, 1, 1, PixelType::Float32);
    LImage u = img.ConvertTo(PixelType::UInt8);
    const uint8_t* px = static_cast<const uint8_t*>(u.Data());
    EXPECT_EQ(px[0], 0);
    EXPECT_EQ(px[1], 128);
    EXPECT_EQ(px[2], 255);
}

TEST(LImageTest, ToRgbFromGray) {
    uint8_t data[2] = {10, 200};
    LImage gray = LImage::FromData(data, 2, 1, PixelType::UInt8, ChannelType::Gray);
    LImage rgb = gray.ToRgb();
    ASSERT_EQ(rgb.Channels(), 3);
    const uint8_t* px = static_cast<const uint8_t*>(rgb.Data());
    EXPECT_EQ(px[0], 10);
    EXPECT_EQ(px[1], 10);
    EXPECT_EQ(px[2], 10);
    EXPECT_EQ(px[3], 200);
    EXPECT_EQ(px[5], 200);
}

TEST(LImageTest, ToRgbDropsAlpha) {
    uint8_t data[4] = {1, 2, 3, 99};
    LImage rgba = LImage::FromData(data, 1, 1, PixelType::UInt8, ChannelType::RGBA);
    LImage rgb = rgba.ToRgb();
    ASSERT_EQ(rgb.Channels(), 3);
    const uint8_t* px = static_cast<const uint8_t*>(rgb.Data());
    EXPECT_EQ(px[0], 1);
    EXPECT_EQ(px[1], 2);
    EXPECT_EQ(px[2], 3);
}

// =============================================================================
// File I/O
// =============================================================================

class ImageIOTest : public ::testing::Test {
protected:
    std::string testDir_ = "/tmp/lookforge_test/imageio";

    void SetUp() override {
        Platform::CreateDirectory(testDir_);
    }

    void TearDown() override {
        Platform::DeleteFile(testDir_ + "/roundtrip.png");
        Platform::DeleteFile(testDir_ + "/nested/dir/out.png");
        Platform::DeleteFile(testDir_ + "/gray_alpha.png");
    }
};

TEST_F(ImageIOTest, PngRoundTrip) {
    LImage img(8, 4);
    for (int32_t y = 0; y < 4; ++y) {
        uint8_t* row = static_cast<uint8_t*>(img.RowPtr(y));
        for (int32_t x = 0; x < 8 * 3; ++x) {
            row[x] = static_cast<uint8_t>(y * 50 + x);
        }
    }

    std::string path = testDir_ + "/roundtrip.png";
    IO::WriteImage(img, path);

    LImage loaded = IO::ReadRgbImage(path);
    ASSERT_EQ(loaded.Width(), 8);
    ASSERT_EQ(loaded.Height(), 4);
    for (int32_t y = 0; y < 4; ++y) {
        EXPECT_EQ(std::memcmp(loaded.RowPtr(y), img.RowPtr(y), 8 * 3), 0);
    }
}

TEST_F(ImageIOTest, WriteCreatesParentDirectories) {
    LImage img(2, 2);
    std::string path = testDir_ + "/nested/dir/out.png";
    IO::WriteImage(img, path);
    EXPECT_TRUE(Platform::FileExists(path));
}

TEST_F(ImageIOTest, ReadFloatNormalizes) {
    LImage img(1, 1);
    static_cast<uint8_t*>(img.Data())[0] = 255;
    std::string path = testDir_ + "/roundtrip.png";
    IO::WriteImage(img, path);

    LImage f = IO::ReadRgbImageFloat(path);
    EXPECT_EQ(f.Type(), PixelType::Float32);
    EXPECT_FLOAT_EQ(static_cast<const float*>(f.Data())[0], 1.0f);
}

TEST_F(ImageIOTest, GrayAlphaPngReadsAsRgb) {
    // 3x2 gray+alpha pixels: (gray, alpha)
    const uint8_t pixels[] = {
        0, 255,   100, 128,  200, 0,
        50, 255,  150, 64,   255, 10,
    };
    std::string path = testDir_ + "/gray_alpha.png";
    ASSERT_NE(stbi_write_png(path.c_str(), 3, 2, 2, pixels, 3 * 2), 0);

    LImage loaded = IO::ReadRgbImage(path);
    ASSERT_EQ(loaded.Width(), 3);
    ASSERT_EQ(loaded.Height(), 2);
    EXPECT_EQ(loaded.Channels(), 3);
    EXPECT_EQ(loaded.Type(), PixelType::UInt8);

    for (int32_t y = 0; y < 2; ++y) {
        const uint8_t* row = static_cast<const uint8_t*>(loaded.RowPtr(y));
        for (int32_t x = 0; x < 3; ++x) {
            uint8_t gray = pixels[(y * 3 + x) * 2];
            EXPECT_EQ(row[x * 3 + 0], gray);
            EXPECT_EQ(row[x * 3 + 1], gray);
            EXPECT_EQ(row[x * 3 + 2], gray);
        }
    }
}

TEST_F(ImageIOTest, MissingFileThrows) {
    EXPECT_THROW(IO::ReadRgbImage(testDir_ + "/does_not_exist.png"), IOException);
}

TEST_F(ImageIOTest, WriteFloatImageThrows) {
    LImage img(2, 2, PixelType::Float32);
    EXPECT_THROW(IO::WriteImage(img, testDir_ + "/roundtrip.png"), UnsupportedException);
}

TEST(ImageIOFormatTest, LossyDetection) {
    EXPECT_TRUE(IO::IsLossyFormat("a.jpg"));
    EXPECT_TRUE(IO::IsLossyFormat("dir/a.JPEG"));
    EXPECT_FALSE(IO::IsLossyFormat("a.png"));
    EXPECT_FALSE(IO::IsLossyFormat("a.bmp"));
}
