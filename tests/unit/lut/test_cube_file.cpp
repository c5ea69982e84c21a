/**
 * @file test_cube_file.cpp
 * @brief Unit tests for Lut/CubeFile.h
 */

#include <gtest/gtest.h>
#include <LookForge/Lut/CubeFile.h>
#include <LookForge/Lut/LutGenerator.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Platform/FileIO.h>

#include <cctype>
#include <cstdint>
#include <sstream>

using namespace Look::Forge;
using namespace Look::Forge::Lut;

namespace {

std::string IdentityCube2(const std::string& header) {
    return header +
           "0 0 0\n1 0 0\n0 1 0\n1 1 0\n"
           "0 0 1\n1 0 1\n0 1 1\n1 1 1\n";
}

} // namespace

// ============================================================================
// Format
// ============================================================================

TEST(FormatCubeTest, HeaderLayout) {
    std::string text = FormatCube(Lut3D::Identity(2));
    std::istringstream lines(text);
    std::string line;

    std::getline(lines, line);
    EXPECT_EQ(line, "TITLE \"LookForge Filter\"");
    std::getline(lines, line);
    EXPECT_EQ(line, "LUT_3D_SIZE 2");
    std::getline(lines, line);
    EXPECT_EQ(line, "");
    std::getline(lines, line);
    EXPECT_EQ(line, "DOMAIN_MIN 0.0 0.0 0.0");
    std::getline(lines, line);
    EXPECT_EQ(line, "DOMAIN_MAX 1.0 1.0 1.0");
    std::getline(lines, line);
    EXPECT_EQ(line, "");
    std::getline(lines, line);
    EXPECT_EQ(line, "0.000000 0.000000 0.000000");
    std::getline(lines, line);
    EXPECT_EQ(line, "1.000000 0.000000 0.000000");
}

TEST(FormatCubeTest, CustomTitleAndRowCount) {
    std::string text = FormatCube(Lut3D::Identity(3), "Warm Look");
    EXPECT_EQ(text.rfind("TITLE \"Warm Look\"\n", 0), 0u);

    size_t rows = 0;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && (std::isdigit(static_cast<unsigned char>(line[0])) || line[0] == '-')) {
            ++rows;
        }
    }
    EXPECT_EQ(rows, 27u);
}

TEST(FormatCubeTest, EmptyLutThrows) {
    EXPECT_THROW(FormatCube(Lut3D()), InvalidArgumentException);
}

// ============================================================================
// Parse
// ============================================================================

TEST(ParseCubeTest, MinimalFile) {
    Lut3D lut = ParseCube(IdentityCube2("LUT_3D_SIZE 2\n"));
    EXPECT_EQ(lut.Size(), 2);
    EXPECT_DOUBLE_EQ(lut.MaxDifference(Lut3D::Identity(2)), 0.0);
}

TEST(ParseCubeTest, SkipsCommentsTitleDomainAndBlankLines) {
    Lut3D lut = ParseCube(IdentityCube2(
        "# generated\r\n"
        "TITLE \"x\"\r\n"
        "\n"
        "DOMAIN_MIN 0 0 0\n"
        "DOMAIN_MAX 1 1 1\n"
        "   LUT_3D_SIZE 2   \n"));
    EXPECT_EQ(lut.Size(), 2);
    EXPECT_DOUBLE_EQ(lut.At(1, 1, 0, 1), 1.0);
}

TEST(ParseCubeTest, MissingSize) {
    EXPECT_THROW(ParseCube(IdentityCube2("")), FormatException);
}

TEST(ParseCubeTest, InvalidSize) {
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE two\n")), FormatException);
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE 1\n")), FormatException);
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE 300\n")), FormatException);
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE\n")), FormatException);
}

TEST(ParseCubeTest, RowCountMismatch) {
    EXPECT_THROW(ParseCube("LUT_3D_SIZE 2\n0 0 0\n1 1 1\n"), FormatException);
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE 3\n")), FormatException);
}

TEST(ParseCubeTest, MalformedRow) {
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE 2\n0 0\n")), FormatException);
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE 2\n0 0 0 0\n")), FormatException);
    EXPECT_THROW(ParseCube(IdentityCube2("LUT_3D_SIZE 2\n0 x 0\n")), FormatException);
}

TEST(ParseCubeTest, OneDimensionalUnsupported) {
    EXPECT_THROW(ParseCube("LUT_1D_SIZE 4\n0 0 0\n"), UnsupportedException);
}

TEST(ParseCubeTest, FormatRoundTrip) {
    Lut3D lut = Lut3D::Identity(5);
    lut.Set(1, 2, 3, 0.123456789, 0.987654321, 0.5);
    Lut3D parsed = ParseCube(FormatCube(lut));
    EXPECT_EQ(parsed.Size(), 5);
    EXPECT_LE(parsed.MaxDifference(lut), 1e-6);
}

// ============================================================================
// Files
// ============================================================================

class CubeFileTest : public ::testing::Test {
protected:
    std::string testDir_ = "/tmp/lookforge_test/cube";

    void SetUp() override {
        Platform::CreateDirectory(testDir_);
    }

    void TearDown() override {
        Platform::DeleteFile(testDir_ + "/look.cube");
    }
};

TEST_F(CubeFileTest, WriteThenRead) {
    std::string path = testDir_ + "/look.cube";
    WriteCube(Lut3D::Identity(9), path, "Test");
    EXPECT_TRUE(Platform::FileExists(path));

    Lut3D lut = ReadCube(path);
    EXPECT_EQ(lut.Size(), 9);
    EXPECT_LE(lut.MaxDifference(Lut3D::Identity(9)), 1e-6);
}

TEST_F(CubeFileTest, ReadMissingFile) {
    EXPECT_THROW(ReadCube(testDir_ + "/missing.cube"), IOException);
}

TEST_F(CubeFileTest, GeneratedLutSurvivesExport) {
    LImage ref(16, 16);
    for (int32_t y = 0; y < 16; ++y) {
        uint8_t* row = static_cast<uint8_t*>(ref.RowPtr(y));
        for (int32_t x = 0; x < 16; ++x) {
            row[x * 3 + 0] = static_cast<uint8_t>(100 + x * 8);
            row[x * 3 + 1] = static_cast<uint8_t>(80 + y * 5);
            row[x * 3 + 2] = static_cast<uint8_t>(60 + x * 2);
        }
    }
    LutParams params;
    params.size = 9;
    params.transfer.method = Transfer::TransferMethod::GlobalLab;
    Lut3D lut = GenerateLut(ref, params);

    std::string path = testDir_ + "/look.cube";
    WriteCube(lut, path);
    EXPECT_LE(ReadCube(path).MaxDifference(lut), 1e-6);
}
