/**
 * @file test_fileio.cpp
 * @brief Unit tests for Platform/FileIO.h
 */

#include <gtest/gtest.h>
#include <LookForge/Platform/FileIO.h>

using namespace Look::Forge::Platform;

class FileIOTest : public ::testing::Test {
protected:
    std::string testDir_ = "/tmp/lookforge_test/fileio";

    void SetUp() override {
        CreateDirectory(testDir_);
    }

    void TearDown() override {
        DeleteFile(testDir_ + "/test.txt");
        DeleteFile(testDir_ + "/sub/deeper/file.txt");
        DeleteFile(testDir_ + "/parent/x.txt");
    }
};

// ============================================================================
// Path Utilities
// ============================================================================

TEST_F(FileIOTest, GetExtension) {
    EXPECT_EQ(GetExtension("photo.jpg"), ".jpg");
    EXPECT_EQ(GetExtension("dir/photo.JPG"), ".jpg");
    EXPECT_EQ(GetExtension("a/b.c/lut.cube"), ".cube");
    EXPECT_EQ(GetExtension("noext"), "");
    EXPECT_EQ(GetExtension(".hidden"), "");
}

TEST_F(FileIOTest, GetStem) {
    EXPECT_EQ(GetStem("a/b/photo.jpg"), "photo");
    EXPECT_EQ(GetStem("archive.tar.gz"), "archive.tar");
    EXPECT_EQ(GetStem("noext"), "noext");
}

TEST_F(FileIOTest, EnsureParentDirectory) {
    EXPECT_TRUE(EnsureParentDirectory("photo.jpg"));
    ASSERT_TRUE(EnsureParentDirectory(testDir_ + "/parent/x.txt"));
    ASSERT_TRUE(WriteTextFile(testDir_ + "/parent/x.txt", "x"));
    EXPECT_TRUE(FileExists(testDir_ + "/parent/x.txt"));
}

// ============================================================================
// File Operations
// ============================================================================

TEST_F(FileIOTest, WriteAndReadText) {
    std::string path = testDir_ + "/test.txt";
    ASSERT_TRUE(WriteTextFile(path, "TITLE \"x\"\nLUT_3D_SIZE 2\n"));
    EXPECT_TRUE(FileExists(path));

    std::string content;
    ASSERT_TRUE(ReadTextFile(path, content));
    EXPECT_EQ(content, "TITLE \"x\"\nLUT_3D_SIZE 2\n");
}

TEST_F(FileIOTest, WriteReplacesExistingContent) {
    std::string path = testDir_ + "/test.txt";
    ASSERT_TRUE(WriteTextFile(path, "first version, longer"));
    ASSERT_TRUE(WriteTextFile(path, "second"));

    std::string content;
    ASSERT_TRUE(ReadTextFile(path, content));
    EXPECT_EQ(content, "second");
}

TEST_F(FileIOTest, WriteCreatesParents) {
    std::string path = testDir_ + "/sub/deeper/file.txt";
    ASSERT_TRUE(WriteTextFile(path, "x"));
    EXPECT_TRUE(FileExists(testDir_ + "/sub/deeper/file.txt"));
}

TEST_F(FileIOTest, ReadMissingFails) {
    std::string content = "unchanged";
    EXPECT_FALSE(ReadTextFile(testDir_ + "/missing.txt", content));
    EXPECT_FALSE(FileExists(testDir_ + "/missing.txt"));
}

TEST_F(FileIOTest, DeleteFile) {
    std::string path = testDir_ + "/test.txt";
    ASSERT_TRUE(WriteTextFile(path, "x"));
    EXPECT_TRUE(DeleteFile(path));
    EXPECT_FALSE(FileExists(path));
}
