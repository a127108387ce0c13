// File: tests/mining/frequent_itemset_miner_test.cpp
#include "mining/frequent_itemset_miner.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <thread>

namespace arminer {
namespace {

// ============================================================================
// Test Fixture
// ============================================================================

class FrequentItemsetMinerTest : public ::testing::Test {
protected:
    // a, b, c appear together often enough to reach level 3
    TransactionStore store_ = TransactionStore::Load({
        {"a", "b", "c"},
        {"a", "b", "c"},
        {"a", "b", "d"},
        {"a", "c"},
        {"b", "c", "e"},
        {"a", "b", "c", "d"},
    });

    ItemID Id(const std::string& label) const {
        return *store_.Dictionary().Find(label);
    }

    static std::set<Itemset> ItemsetsOf(const std::vector<FrequentItemset>& found) {
        std::set<Itemset> result;
        for (const auto& f : found) {
            result.insert(f.items);
        }
        return result;
    }
};

// ============================================================================
// Thresholds
// ============================================================================

TEST(MinSupportCountTest, RoundsUpWithTolerance) {
    EXPECT_EQ(2u, FrequentItemsetMiner::MinSupportCount(0.5, 4));
    EXPECT_EQ(3u, FrequentItemsetMiner::MinSupportCount(0.5, 5));
    EXPECT_EQ(3u, FrequentItemsetMiner::MinSupportCount(0.3, 10));
    EXPECT_EQ(10u, FrequentItemsetMiner::MinSupportCount(1.0, 10));
}

TEST(MinSupportCountTest, NeverBelowOne) {
    EXPECT_EQ(1u, FrequentItemsetMiner::MinSupportCount(0.001, 10));
    EXPECT_EQ(1u, FrequentItemsetMiner::MinSupportCount(0.5, 1));
}

TEST(FrequentItemsetMinerConfigTest, InvalidConfigsThrow) {
    FrequentItemsetMiner::Config config;

    config.min_support = 0.0;
    EXPECT_THROW(FrequentItemsetMiner miner(config), InvalidParameterError);

    config.min_support = 1.5;
    EXPECT_THROW(FrequentItemsetMiner miner(config), InvalidParameterError);

    config = FrequentItemsetMiner::Config();
    config.min_len = 0;
    EXPECT_THROW(FrequentItemsetMiner miner(config), InvalidParameterError);

    config = FrequentItemsetMiner::Config();
    config.min_len = 3;
    config.max_len = 2;
    EXPECT_THROW(FrequentItemsetMiner miner(config), InvalidParameterError);

    config = FrequentItemsetMiner::Config();
    config.num_threads = 0;
    EXPECT_THROW(FrequentItemsetMiner miner(config), InvalidParameterError);

    config = FrequentItemsetMiner::Config();
    config.time_limit = std::chrono::milliseconds(-5);
    EXPECT_THROW(FrequentItemsetMiner miner(config), InvalidParameterError);
}

// ============================================================================
// Mining
// ============================================================================

TEST_F(FrequentItemsetMinerTest, FindsExpectedItemsets) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.5;  // count >= 3
    FrequentItemsetMiner miner(config);

    auto found = miner.Mine(store_);

    std::set<Itemset> expected = {
        {Id("a")}, {Id("b")}, {Id("c")},
        {Id("a"), Id("b")}, {Id("a"), Id("c")}, {Id("b"), Id("c")},
        {Id("a"), Id("b"), Id("c")},
    };
    EXPECT_EQ(expected, ItemsetsOf(found));

    for (const auto& f : found) {
        EXPECT_EQ(store_.SupportCount(f.items), f.support_count);
        EXPECT_EQ(6u, f.transaction_count);
        EXPECT_GE(f.Support(), 0.5);
    }
}

TEST_F(FrequentItemsetMinerTest, ResultOrderedBySizeThenItems) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    FrequentItemsetMiner miner(config);

    auto found = miner.Mine(store_);
    ASSERT_FALSE(found.empty());

    for (size_t i = 1; i < found.size(); ++i) {
        const auto& prev = found[i - 1].items;
        const auto& cur = found[i].items;
        if (prev.size() == cur.size()) {
            EXPECT_LT(prev, cur);
        } else {
            EXPECT_LT(prev.size(), cur.size());
        }
    }
}

TEST_F(FrequentItemsetMinerTest, EverySubsetOfFrequentItemsetIsFrequent) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    FrequentItemsetMiner miner(config);

    auto found = miner.Mine(store_);
    auto all = ItemsetsOf(found);

    for (const auto& f : found) {
        if (f.Size() < 2) {
            continue;
        }
        for (size_t skip = 0; skip < f.Size(); ++skip) {
            Itemset subset;
            for (size_t i = 0; i < f.Size(); ++i) {
                if (i != skip) {
                    subset.push_back(f.items[i]);
                }
            }
            EXPECT_TRUE(all.count(subset)) << ToString(subset) << " missing";
            EXPECT_GE(store_.SupportCount(subset), f.support_count);
        }
    }
}

TEST_F(FrequentItemsetMinerTest, LengthBounds) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    config.min_len = 2;
    config.max_len = 2;
    FrequentItemsetMiner miner(config);

    auto found = miner.Mine(store_);
    ASSERT_FALSE(found.empty());
    for (const auto& f : found) {
        EXPECT_EQ(2u, f.Size());
    }
    EXPECT_EQ(2u, miner.GetStatistics().levels.size());
    EXPECT_FALSE(miner.GetStatistics().aborted);
}

TEST_F(FrequentItemsetMinerTest, NothingFrequentAtFullSupport) {
    FrequentItemsetMiner::Config config;
    config.min_support = 1.0;
    FrequentItemsetMiner miner(config);

    EXPECT_TRUE(miner.Mine(store_).empty());
    EXPECT_EQ(6u, miner.GetStatistics().min_support_count);
}

TEST_F(FrequentItemsetMinerTest, StrategiesAndThreadsAgree) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    auto reference = FrequentItemsetMiner(config).Mine(store_);

    config.counting = CountingStrategy::TRANSACTION_SCAN;
    for (size_t threads : {1u, 2u, 4u}) {
        config.num_threads = threads;
        EXPECT_EQ(reference, FrequentItemsetMiner(config).Mine(store_)) << "threads=" << threads;
    }
}

// ============================================================================
// Statistics
// ============================================================================

TEST_F(FrequentItemsetMinerTest, LevelStatistics) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.5;
    FrequentItemsetMiner miner(config);
    auto found = miner.Mine(store_);

    const auto& stats = miner.GetStatistics();
    EXPECT_EQ(3u, stats.min_support_count);
    EXPECT_EQ(found.size(), stats.total_frequent);
    ASSERT_GE(stats.levels.size(), 3u);

    EXPECT_EQ(1u, stats.levels[0].level);
    EXPECT_EQ(5u, stats.levels[0].candidates_generated);
    EXPECT_EQ(3u, stats.levels[0].frequent_found);

    EXPECT_EQ(3u, stats.levels[1].candidates_generated);
    EXPECT_EQ(3u, stats.levels[1].frequent_found);

    EXPECT_EQ(1u, stats.levels[2].frequent_found);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(FrequentItemsetMinerTest, CancelBeforeSecondLevelKeepsSingles) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    config.cancel_check = [] { return true; };
    FrequentItemsetMiner miner(config);

    auto found = miner.Mine(store_);
    ASSERT_FALSE(found.empty());
    for (const auto& f : found) {
        EXPECT_EQ(1u, f.Size());
    }
    EXPECT_TRUE(miner.GetStatistics().aborted);
}

TEST_F(FrequentItemsetMinerTest, LevelInFlightIsDiscarded) {
    // First poll passes, second (after counting level 2) cancels
    int polls = 0;
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    config.cancel_check = [&polls] { return ++polls >= 2; };
    FrequentItemsetMiner miner(config);

    auto found = miner.Mine(store_);
    for (const auto& f : found) {
        EXPECT_EQ(1u, f.Size());
    }
    EXPECT_TRUE(miner.GetStatistics().aborted);
    EXPECT_EQ(1u, miner.GetStatistics().levels.size());
}

TEST_F(FrequentItemsetMinerTest, CompletedLevelsSurviveCancellation) {
    int polls = 0;
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    config.cancel_check = [&polls] { return ++polls >= 3; };
    FrequentItemsetMiner miner(config);

    auto found = miner.Mine(store_);
    size_t max_size = 0;
    for (const auto& f : found) {
        max_size = std::max(max_size, f.Size());
    }
    EXPECT_EQ(2u, max_size);
    EXPECT_TRUE(miner.GetStatistics().aborted);
}

TEST_F(FrequentItemsetMinerTest, ExpiredTimeLimitAborts) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.3;
    config.time_limit = std::chrono::milliseconds(1);
    // Burn the budget inside the first poll
    config.cancel_check = [] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return false;
    };
    FrequentItemsetMiner miner(config);

    miner.Mine(store_);
    EXPECT_TRUE(miner.GetStatistics().aborted);
}

// ============================================================================
// Debug logging
// ============================================================================

TEST_F(FrequentItemsetMinerTest, DebugLoggingWritesTaggedLines) {
    FrequentItemsetMiner::Config config;
    config.min_support = 0.5;
    config.debug_logging = true;
    FrequentItemsetMiner miner(config);

    std::ostringstream log;
    miner.SetDebugStream(&log);
    miner.Mine(store_);

    EXPECT_NE(std::string::npos, log.str().find("[FrequentItemsetMiner] Mining 6 transactions"));
    EXPECT_NE(std::string::npos, log.str().find("Level 1: 3 frequent itemsets"));
}

TEST_F(FrequentItemsetMinerTest, DebugLoggingOffByDefault) {
    FrequentItemsetMiner miner;
    std::ostringstream log;
    miner.SetDebugStream(&log);
    miner.Mine(store_);

    EXPECT_TRUE(log.str().empty());
}

} // namespace
} // namespace arminer
