#include <gtest/gtest.h>

#include <vector>

#include "harp/block_accumulator.hpp"

using namespace harp;

TEST(BlockAccumulatorTest, EmitsOverlappingBlocks) {
    BlockAccumulator acc(8, 4);
    std::vector<float> input(20);
    for (int i = 0; i < 20; ++i) input[i] = static_cast<float>(i);

    std::vector<float> firsts;
    const int emitted = acc.push(input.data(), 20, [&](const float* block, int n) {
        ASSERT_EQ(n, 8);
        EXPECT_FLOAT_EQ(block[7], block[0] + 7.0f);
        firsts.push_back(block[0]);
    });
    EXPECT_EQ(emitted, 4);
    EXPECT_EQ(firsts, (std::vector<float>{0.0f, 4.0f, 8.0f, 12.0f}));
}

TEST(BlockAccumulatorTest, CarriesStateAcrossPeriods) {
    BlockAccumulator acc(6, 3);
    std::vector<float> a = {1, 2, 3, 4};
    std::vector<float> b = {5, 6, 7, 8, 9};
    std::vector<float> lasts;
    auto cb = [&](const float* block, int n) { lasts.push_back(block[n - 1]); };
    EXPECT_EQ(acc.push(a.data(), 4, cb), 0);
    EXPECT_EQ(acc.push(b.data(), 5, cb), 2);
    EXPECT_EQ(lasts, (std::vector<float>{6.0f, 9.0f}));
}

TEST(BlockAccumulatorTest, HopDefaultsToBlockSize) {
    BlockAccumulator acc(4, 0);
    EXPECT_EQ(acc.hop(), 4);
    std::vector<float> input(12, 1.0f);
    EXPECT_EQ(acc.push(input.data(), 12, nullptr), 3);
    acc.reset();
    EXPECT_EQ(acc.push(input.data(), 3, nullptr), 0);
    EXPECT_EQ(acc.push(nullptr, 3, nullptr), 0);
}
