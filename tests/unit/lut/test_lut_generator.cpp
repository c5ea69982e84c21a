/**
 * @file test_lut_generator.cpp
 * @brief Unit tests for Lut/LutGenerator.h
 */

#include <gtest/gtest.h>
#include <LookForge/Lut/LutGenerator.h>
#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Platform/FileIO.h>

#include <cstdint>
#include <limits>

using namespace Look::Forge;
using namespace Look::Forge::Lut;
using Look::Forge::Transfer::TransferMethod;

namespace {

LImage MakeWarmReference() {
    LImage img(24, 16);
    for (int32_t y = 0; y < 16; ++y) {
        uint8_t* row = static_cast<uint8_t*>(img.RowPtr(y));
        for (int32_t x = 0; x < 24; ++x) {
            row[x * 3 + 0] = static_cast<uint8_t>(120 + x * 5);
            row[x * 3 + 1] = static_cast<uint8_t>(60 + y * 6);
            row[x * 3 + 2] = static_cast<uint8_t>(20 + (x + y) % 30);
        }
    }
    return img;
}

LImage MakeSolid(uint8_t r, uint8_t g, uint8_t b) {
    LImage img(8, 8);
    for (int32_t y = 0; y < 8; ++y) {
        uint8_t* row = static_cast<uint8_t*>(img.RowPtr(y));
        for (int32_t x = 0; x < 8; ++x) {
            row[x * 3 + 0] = r;
            row[x * 3 + 1] = g;
            row[x * 3 + 2] = b;
        }
    }
    return img;
}

} // namespace

TEST(LutParamsTest, Defaults) {
    LutParams p = LutParams::Default();
    EXPECT_EQ(p.size, 33);
    EXPECT_EQ(p.transfer.method, TransferMethod::ZoneBased);
    EXPECT_DOUBLE_EQ(p.transfer.strength, 1.0);
}

TEST(GenerateLutTest, ValuesInUnitRange) {
    LImage ref = MakeWarmReference();
    for (TransferMethod m : {TransferMethod::GlobalLab, TransferMethod::ZoneBased,
                             TransferMethod::Histogram, TransferMethod::Improved}) {
        LutParams p;
        p.size = 9;
        p.transfer.method = m;
        Lut3D lut = GenerateLut(ref, p);
        ASSERT_EQ(lut.Size(), 9);
        for (double v : lut.Data()) {
            ASSERT_GE(v, 0.0);
            ASSERT_LE(v, 1.0);
        }
    }
}

TEST(GenerateLutTest, ZeroStrengthIsIdentity) {
    LutParams p;
    p.size = 9;
    p.transfer.strength = 0.0;
    Lut3D lut = GenerateLut(MakeWarmReference(), p);
    EXPECT_LE(lut.MaxDifference(Lut3D::Identity(9)), 1e-4);
}

TEST(GenerateLutTest, SolidReferenceCollapsesLattice) {
    LutParams p;
    p.size = 5;
    p.transfer.method = TransferMethod::GlobalLab;
    Lut3D lut = GenerateLut(MakeSolid(200, 80, 40), p);

    for (int32_t b = 0; b < 5; ++b) {
        for (int32_t g = 0; g < 5; ++g) {
            for (int32_t r = 0; r < 5; ++r) {
                EXPECT_NEAR(lut.At(r, g, b, 0), 200.0 / 255.0, 1e-4);
                EXPECT_NEAR(lut.At(r, g, b, 1), 80.0 / 255.0, 1e-4);
                EXPECT_NEAR(lut.At(r, g, b, 2), 40.0 / 255.0, 1e-4);
            }
        }
    }
}

TEST(GenerateLutTest, WarmReferenceWarmsGray) {
    LutParams p;
    p.size = 9;
    Lut3D lut = GenerateLut(MakeWarmReference(), p);
    // Mid gray node
    EXPECT_GT(lut.At(4, 4, 4, 0), lut.At(4, 4, 4, 2));
}

TEST(GenerateLutTest, InvalidParams) {
    LImage ref = MakeWarmReference();
    LutParams p;
    p.size = 1;
    EXPECT_THROW(GenerateLut(ref, p), InvalidArgumentException);

    p.size = 9;
    p.transfer.strength = 2.0;
    EXPECT_THROW(GenerateLut(ref, p), InvalidArgumentException);

    p.transfer.strength = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(GenerateLut(ref, p), InvalidArgumentException);

    EXPECT_THROW(GenerateLut(LImage(), LutParams::Default()), InvalidArgumentException);
}

class LutGeneratorFileTest : public ::testing::Test {
protected:
    std::string testDir_ = "/tmp/lookforge_test/generator";

    void SetUp() override {
        Platform::CreateDirectory(testDir_);
        IO::WriteImage(MakeWarmReference(), testDir_ + "/ref.png");
    }

    void TearDown() override {
        Platform::DeleteFile(testDir_ + "/ref.png");
    }
};

TEST_F(LutGeneratorFileTest, MatchesInMemory) {
    LutParams p;
    p.size = 5;
    Lut3D fromFile = GenerateLutFromFile(testDir_ + "/ref.png", p);
    Lut3D inMemory = GenerateLut(MakeWarmReference(), p);
    EXPECT_DOUBLE_EQ(fromFile.MaxDifference(inMemory), 0.0);
}

TEST_F(LutGeneratorFileTest, MissingFile) {
    EXPECT_THROW(GenerateLutFromFile(testDir_ + "/missing.png"), IOException);
}
