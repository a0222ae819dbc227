#include <algorithm>
#include <array>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <codalign/shuffle.hpp>

using codalign::fisher_yates_shuffle;
using codalign::make_shuffle_rng;

TEST(ShuffleTest, ProducesPermutation) {
    std::vector<int> items;
    for (int i = 0; i < 100; ++i)
        items.push_back(i % 7);
    auto original = items;
    auto rng = make_shuffle_rng(42);
    fisher_yates_shuffle(items, rng);

    auto a = original;
    auto b = items;
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    EXPECT_EQ(a, b);
}

TEST(ShuffleTest, ShortListsUntouched) {
    auto rng = make_shuffle_rng(7);
    std::vector<std::string> empty;
    fisher_yates_shuffle(empty, rng);
    EXPECT_TRUE(empty.empty());

    std::vector<std::string> one{"only.wav"};
    fisher_yates_shuffle(one, rng);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0], "only.wav");
}

TEST(ShuffleTest, SeedMakesOrderReproducible) {
    std::vector<int> base;
    for (int i = 0; i < 20; ++i)
        base.push_back(i);

    auto x = base;
    auto y = base;
    auto z = base;
    auto r1 = make_shuffle_rng(1234);
    auto r2 = make_shuffle_rng(1234);
    auto r3 = make_shuffle_rng(4321);
    fisher_yates_shuffle(x, r1);
    fisher_yates_shuffle(y, r2);
    fisher_yates_shuffle(z, r3);
    EXPECT_EQ(x, y);
    EXPECT_NE(x, z);
}

TEST(ShuffleTest, FirstSlotRoughlyUniform) {
    std::array<int, 3> hits{};
    auto rng = make_shuffle_rng(99);
    const int rounds = 30000;
    for (int r = 0; r < rounds; ++r) {
        std::vector<int> v{0, 1, 2};
        fisher_yates_shuffle(v, rng);
        ++hits[v[0]];
    }
    for (int h : hits) {
        EXPECT_GT(h, rounds / 3 - 800);
        EXPECT_LT(h, rounds / 3 + 800);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
