/**
 * @file test_transfer_engine.cpp
 * @brief Unit tests for Transfer/TransferEngine.h
 */

#include <gtest/gtest.h>
#include <LookForge/Transfer/TransferEngine.h>
#include <LookForge/Transfer/TransferAlgorithms.h>
#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Platform/FileIO.h>

#include <cstdint>
#include <cstring>
#include <limits>

using namespace Look::Forge;
using namespace Look::Forge::Transfer;

namespace {

LImage MakeGradient(int32_t w, int32_t h, int rBase, int gBase, int bBase) {
    LImage img(w, h);
    for (int32_t y = 0; y < h; ++y) {
        uint8_t* row = static_cast<uint8_t*>(img.RowPtr(y));
        for (int32_t x = 0; x < w; ++x) {
            row[x * 3 + 0] = static_cast<uint8_t>((rBase + x * 7 + y * 3) % 256);
            row[x * 3 + 1] = static_cast<uint8_t>((gBase + x * 2 + y * 11) % 256);
            row[x * 3 + 2] = static_cast<uint8_t>((bBase + x * 5 + y * 5) % 256);
        }
    }
    return img;
}

bool SamePixels(const LImage& a, const LImage& b) {
    if (a.Width() != b.Width() || a.Height() != b.Height() || a.Type() != b.Type()) {
        return false;
    }
    for (int32_t y = 0; y < a.Height(); ++y) {
        if (std::memcmp(a.RowPtr(y), b.RowPtr(y), static_cast<size_t>(a.Width()) * 3) != 0) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// Method names
// ============================================================================

TEST(TransferMethodTest, ParseAllNames) {
    EXPECT_EQ(ParseTransferMethod("global_lab"), TransferMethod::GlobalLab);
    EXPECT_EQ(ParseTransferMethod("zone_based"), TransferMethod::ZoneBased);
    EXPECT_EQ(ParseTransferMethod("histogram"), TransferMethod::Histogram);
    EXPECT_EQ(ParseTransferMethod("improved"), TransferMethod::Improved);
}

TEST(TransferMethodTest, NamesRoundTrip) {
    for (const std::string& name : TransferMethodNames()) {
        EXPECT_EQ(TransferMethodName(ParseTransferMethod(name)), name);
    }
    EXPECT_EQ(TransferMethodNames().size(), 4u);
}

TEST(TransferMethodTest, UnknownNameListsValidOnes) {
    try {
        ParseTransferMethod("neural");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("neural"), std::string::npos);
        EXPECT_NE(msg.find("global_lab, zone_based, histogram, improved"), std::string::npos);
    }
}

TEST(TransferParamsTest, Defaults) {
    TransferParams p = TransferParams::Default();
    EXPECT_EQ(p.method, TransferMethod::ZoneBased);
    EXPECT_DOUBLE_EQ(p.strength, 1.0);
    EXPECT_FALSE(p.preserveLuminance);
}

// ============================================================================
// Lab pipeline
// ============================================================================

TEST(ApplyTransferLabTest, StrengthZeroIsIdentity) {
    LabImage ref = Color::RgbToLab(MakeGradient(16, 8, 200, 40, 10));
    LabImage tgt = Color::RgbToLab(MakeGradient(16, 8, 10, 90, 160));
    TransferParams p;
    p.method = TransferMethod::GlobalLab;
    p.strength = 0.0;
    LabImage out = ApplyTransferLab(ref, tgt, p);
    EXPECT_EQ(out.Values(), tgt.Values());
}

TEST(ApplyTransferLabTest, HalfStrengthBlends) {
    LabImage ref = Color::RgbToLab(MakeGradient(16, 8, 200, 40, 10));
    LabImage tgt = Color::RgbToLab(MakeGradient(16, 8, 10, 90, 160));
    LabImage full = TransferGlobalLab(ref, tgt);

    TransferParams p;
    p.method = TransferMethod::GlobalLab;
    p.strength = 0.5;
    LabImage half = ApplyTransferLab(ref, tgt, p);
    for (size_t i = 0; i < half.Values().size(); ++i) {
        EXPECT_NEAR(half.Values()[i], 0.5 * (tgt.Values()[i] + full.Values()[i]), 1e-9);
    }
}

TEST(ApplyTransferLabTest, PreserveLuminance) {
    LabImage ref = Color::RgbToLab(MakeGradient(16, 8, 200, 40, 10));
    LabImage tgt = Color::RgbToLab(MakeGradient(16, 8, 10, 90, 160));
    TransferParams p;
    p.method = TransferMethod::Improved;
    p.preserveLuminance = true;
    LabImage out = ApplyTransferLab(ref, tgt, p);
    for (size_t i = 0; i < out.PixelCount(); ++i) {
        EXPECT_DOUBLE_EQ(out.At(i, Color::LAB_L), tgt.At(i, Color::LAB_L));
    }
}

TEST(ApplyTransferLabTest, SolidGrayTakesSolidOrangeMean) {
    uint8_t gray[4 * 4 * 3];
    uint8_t orange[4 * 4 * 3];
    for (int i = 0; i < 16; ++i) {
        gray[i * 3 + 0] = 128; gray[i * 3 + 1] = 128; gray[i * 3 + 2] = 128;
        orange[i * 3 + 0] = 200; orange[i * 3 + 1] = 140; orange[i * 3 + 2] = 80;
    }
    LabImage tgt = Color::RgbToLab(LImage::FromData(gray, 4, 4));
    LabImage ref = Color::RgbToLab(LImage::FromData(orange, 4, 4));

    TransferParams p;
    p.method = TransferMethod::GlobalLab;
    LabImage out = ApplyTransferLab(ref, tgt, p);

    Color::GlobalStats refStats = Color::ComputeGlobalStats(ref);
    for (size_t i = 0; i < out.PixelCount(); ++i) {
        for (int c = 0; c < 3; ++c) {
            EXPECT_NEAR(out.At(i, c), refStats[c].mean, 1e-9);
        }
    }
}

TEST(ApplyTransferLabTest, StrengthOutOfRange) {
    LabImage lab = Color::RgbToLab(MakeGradient(4, 4, 0, 0, 0));
    TransferParams p;
    p.strength = 1.5;
    EXPECT_THROW(ApplyTransferLab(lab, lab, p), InvalidArgumentException);
    p.strength = -0.1;
    EXPECT_THROW(ApplyTransferLab(lab, lab, p), InvalidArgumentException);
}

TEST(ApplyTransferLabTest, NaNStrengthRejected) {
    LImage img = MakeGradient(4, 4, 0, 0, 0);
    LabImage lab = Color::RgbToLab(img);
    TransferParams p;
    p.strength = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ApplyTransferLab(lab, lab, p), InvalidArgumentException);
    EXPECT_THROW(Look::Forge::Transfer::Transfer(img, img, p), InvalidArgumentException);
}

// ============================================================================
// Image pipeline
// ============================================================================

TEST(TransferTest, OutputShapeAndType) {
    LImage ref = MakeGradient(20, 10, 200, 40, 10);
    LImage tgt = MakeGradient(13, 7, 10, 90, 160);
    for (const std::string& name : TransferMethodNames()) {
        TransferParams p;
        p.method = ParseTransferMethod(name);
        TransferResult r = Look::Forge::Transfer::Transfer(ref, tgt, p);
        EXPECT_EQ(r.image.Width(), 13) << name;
        EXPECT_EQ(r.image.Height(), 7) << name;
        EXPECT_EQ(r.image.Type(), PixelType::UInt8) << name;
        EXPECT_EQ(r.image.Channels(), 3) << name;
        EXPECT_EQ(r.method, p.method);
        EXPECT_GE(r.elapsedSeconds, 0.0);
    }
}

TEST(TransferTest, StrengthZeroReturnsTarget) {
    LImage ref = MakeGradient(16, 8, 200, 40, 10);
    LImage tgt = MakeGradient(16, 8, 10, 90, 160);
    TransferParams p;
    p.strength = 0.0;
    TransferResult r = Look::Forge::Transfer::Transfer(ref, tgt, p);
    EXPECT_TRUE(SamePixels(r.image, tgt));
}

TEST(TransferTest, FullStrengthMatchesAlgorithm) {
    LImage ref = MakeGradient(16, 8, 200, 40, 10);
    LImage tgt = MakeGradient(16, 8, 10, 90, 160);
    TransferResult r = Look::Forge::Transfer::Transfer(ref, tgt);

    LabImage expected = TransferZoneBased(Color::RgbToLab(ref), Color::RgbToLab(tgt));
    LImage expectedRgb = Color::QuantizeToU8(Color::LabToRgb(expected));
    EXPECT_TRUE(SamePixels(r.image, expectedRgb));
}

TEST(TransferTest, ReportsReferenceStatistics) {
    LImage ref = MakeGradient(16, 8, 200, 40, 10);
    LImage tgt = MakeGradient(16, 8, 10, 90, 160);
    TransferResult r = Look::Forge::Transfer::Transfer(ref, tgt);
    Color::GlobalStats expected = Color::ComputeGlobalStats(Color::RgbToLab(ref));
    EXPECT_DOUBLE_EQ(r.referenceStats.global[Color::LAB_L].mean,
                     expected[Color::LAB_L].mean);
}

TEST(TransferTest, AcceptsGrayTarget) {
    LImage ref = MakeGradient(8, 8, 200, 40, 10);
    LImage gray(8, 8, PixelType::UInt8, ChannelType::Gray);
    TransferResult r = Look::Forge::Transfer::Transfer(ref, gray);
    EXPECT_EQ(r.image.Channels(), 3);
}

TEST(TransferTest, EmptyInputThrows) {
    LImage ref = MakeGradient(8, 8, 200, 40, 10);
    EXPECT_THROW(Look::Forge::Transfer::Transfer(ref, LImage()), InvalidArgumentException);
    EXPECT_THROW(Look::Forge::Transfer::Transfer(LImage(), ref), InvalidArgumentException);
}

class TransferFilesTest : public ::testing::Test {
protected:
    std::string testDir_ = "/tmp/lookforge_test/transfer";

    void SetUp() override {
        Platform::CreateDirectory(testDir_);
        IO::WriteImage(MakeGradient(12, 6, 200, 40, 10), testDir_ + "/ref.png");
        IO::WriteImage(MakeGradient(12, 6, 10, 90, 160), testDir_ + "/tgt.png");
    }

    void TearDown() override {
        Platform::DeleteFile(testDir_ + "/ref.png");
        Platform::DeleteFile(testDir_ + "/tgt.png");
    }
};

TEST_F(TransferFilesTest, MatchesInMemoryTransfer) {
    TransferResult fromFiles = TransferFiles(testDir_ + "/ref.png", testDir_ + "/tgt.png");
    TransferResult inMemory = Look::Forge::Transfer::Transfer(MakeGradient(12, 6, 200, 40, 10),
                                       MakeGradient(12, 6, 10, 90, 160));
    EXPECT_TRUE(SamePixels(fromFiles.image, inMemory.image));
}

TEST_F(TransferFilesTest, MissingFileThrows) {
    EXPECT_THROW(TransferFiles(testDir_ + "/missing.png", testDir_ + "/tgt.png"), IOException);
}
