/**
 * @file test_random.cpp
 * @brief Unit tests for Platform/Random.h
 */

#include <gtest/gtest.h>
#include <LookForge/Platform/Random.h>

#include <cctype>
#include <set>

using namespace Look::Forge::Platform;

TEST(RandomTest, SeedIsReproducible) {
    Random& rng = Random::Instance();
    rng.SetSeed(12345);
    uint64_t a = rng.Uint64();
    double da = rng.Double();

    rng.SetSeed(12345);
    EXPECT_EQ(rng.GetSeed(), 12345u);
    EXPECT_EQ(rng.Uint64(), a);
    EXPECT_DOUBLE_EQ(rng.Double(), da);
}

TEST(RandomTest, DoubleInUnitInterval) {
    Random& rng = Random::Instance();
    rng.SetSeed(7);
    for (int i = 0; i < 1000; ++i) {
        double v = rng.Double();
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
    }
}

TEST(RandomTest, Uuid4HyphenatedFormat) {
    std::string id = Random::Instance().Uuid4();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
}

TEST(RandomTest, Uuid4CompactUpperCase) {
    std::string id = Random::Instance().Uuid4(true, false);
    ASSERT_EQ(id.size(), 32u);
    for (char c : id) {
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'A' && c <= 'F'))
            << "unexpected character '" << c << "'";
    }
    EXPECT_EQ(id[12], '4');
}

TEST(RandomTest, Uuid4Unique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(Random::Instance().Uuid4());
    }
    EXPECT_EQ(ids.size(), 100u);
}
