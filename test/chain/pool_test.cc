#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "chain/pool.h"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace Giftchain;
using ::testing::UnorderedElementsAre;

class PoolTest : public ::testing::Test {
protected:
    static std::vector<Item> DrainSingleThreaded(Pool& pool) {
        std::vector<Item> drawn;
        while (auto item = pool.Take()) {
            drawn.push_back(*item);
        }
        return drawn;
    }
};

TEST_F(PoolTest, RangeHoldsEveryIdentifierOnce) {
    Pool pool(RangeItems(100), 7);
    EXPECT_EQ(pool.InitialSize(), 100u);
    EXPECT_EQ(pool.Size(), 100u);

    std::vector<Item> drawn = DrainSingleThreaded(pool);
    ASSERT_EQ(drawn.size(), 100u);

    std::sort(drawn.begin(), drawn.end());
    for (Item i = 0; i < 100; ++i) {
        EXPECT_EQ(drawn[i], i + 1);
    }
}

TEST(RangeItemsTest, AscendingFromOne) {
    EXPECT_THAT(RangeItems(4), ::testing::ElementsAre(1, 2, 3, 4));
    EXPECT_TRUE(RangeItems(0).empty());
}

TEST_F(PoolTest, EmptyIsTerminalNotAnError) {
    Pool pool({3, 1, 2}, 1);
    EXPECT_THAT(DrainSingleThreaded(pool), UnorderedElementsAre(1, 2, 3));

    EXPECT_TRUE(pool.Empty());
    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_FALSE(pool.Take().has_value());
    EXPECT_FALSE(pool.Take().has_value());
    EXPECT_EQ(pool.InitialSize(), 3u);
}

TEST_F(PoolTest, EmptyBagFromTheStart) {
    Pool pool(std::vector<Item>{}, 1);
    EXPECT_TRUE(pool.Empty());
    EXPECT_FALSE(pool.Take().has_value());
}

TEST_F(PoolTest, SameSeedSameDrawOrder) {
    Pool a(RangeItems(1000), 42);
    Pool b(RangeItems(1000), 42);
    EXPECT_EQ(DrainSingleThreaded(a), DrainSingleThreaded(b));
}

TEST_F(PoolTest, ShuffleBreaksIdentifierOrder) {
    Pool pool(RangeItems(1000), 42);
    std::vector<Item> drawn = DrainSingleThreaded(pool);
    EXPECT_FALSE(std::is_sorted(drawn.begin(), drawn.end()));
    EXPECT_FALSE(std::is_sorted(drawn.rbegin(), drawn.rend()));
}

TEST_F(PoolTest, DuplicatesInTheInputAreHandedOutAsGiven) {
    Pool pool({1, 1, 2}, 3);
    EXPECT_THAT(DrainSingleThreaded(pool), UnorderedElementsAre(1, 1, 2));
}

TEST_F(PoolTest, ConcurrentTakeNeverRepeatsAnItem) {
    constexpr Item kItems = 20000;
    constexpr int kThreads = 8;
    Pool pool(RangeItems(kItems), 99);

    std::vector<std::vector<Item>> per_thread(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&pool, &per_thread, t]() {
            while (auto item = pool.Take()) {
                per_thread[t].push_back(*item);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<Item> all;
    for (const auto& drawn : per_thread) {
        all.insert(all.end(), drawn.begin(), drawn.end());
    }
    ASSERT_EQ(all.size(), kItems);

    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
    EXPECT_EQ(all.front(), 1u);
    EXPECT_EQ(all.back(), kItems);
    EXPECT_TRUE(pool.Empty());
}
