// File: tests/integration/integration_test.cpp
//
// Integration tests for ARMiner.
// Tests end-to-end workflows and component interactions.

#include "core/mining_api.hpp"
#include "core/rule_mining_engine.hpp"
#include "storage/basket_reader.hpp"
#include "storage/persistent_backend.hpp"
#include <gtest/gtest.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <sstream>

using namespace arminer;

// ============================================================================
// Test Utilities
// ============================================================================

/// Generate random baskets where a few item pairs are strongly correlated
std::vector<std::vector<std::string>> GenerateBaskets(size_t count, size_t num_items,
                                                      unsigned int seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<size_t> item_dist(0, num_items - 1);
    std::uniform_int_distribution<size_t> length_dist(1, 5);
    std::bernoulli_distribution coin(0.8);

    std::vector<std::vector<std::string>> baskets;
    baskets.reserve(count);
    for (size_t t = 0; t < count; ++t) {
        std::vector<std::string> basket;
        size_t length = length_dist(gen);
        for (size_t i = 0; i < length; ++i) {
            size_t item = item_dist(gen);
            basket.push_back("item" + std::to_string(item));
            // item0 pulls item1 along most of the time
            if (item == 0 && coin(gen)) {
                basket.push_back("item1");
            }
        }
        baskets.push_back(std::move(basket));
    }
    return baskets;
}

/// Every itemset with support count >= min_count, by exhaustive enumeration
std::map<Itemset, uint32_t> BruteForceItemsets(const TransactionStore& store, uint32_t min_count) {
    Itemset items = store.Items();
    std::map<Itemset, uint32_t> result;

    const size_t n = items.size();
    for (uint64_t mask = 1; mask < (uint64_t{1} << n); ++mask) {
        Itemset candidate;
        for (size_t i = 0; i < n; ++i) {
            if (mask & (uint64_t{1} << i)) {
                candidate.push_back(items[i]);
            }
        }
        uint32_t count = store.SupportCount(candidate);
        if (count >= min_count) {
            result.emplace(candidate, count);
        }
    }
    return result;
}

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::to_string(getpid()) + "_" + std::to_string(
            std::chrono::system_clock::now().time_since_epoch().count());
        basket_path_ = "/tmp/arminer_integration_" + stamp + ".csv";
        single_path_ = "/tmp/arminer_integration_single_" + stamp + ".csv";
        db_path_ = "/tmp/arminer_integration_" + stamp + ".db";
    }

    void TearDown() override {
        std::filesystem::remove(basket_path_);
        std::filesystem::remove(single_path_);
        std::filesystem::remove(db_path_);
        std::filesystem::remove(db_path_ + "-wal");
        std::filesystem::remove(db_path_ + "-shm");
    }

    void WriteGroceries() {
        std::ofstream basket(basket_path_);
        basket << "# id-less grocery baskets\n"
               << "whole milk,rolls/buns,yogurt\n"
               << "whole milk,rolls/buns\n"
               << "other vegetables,whole milk\n"
               << "rolls/buns,soda\n"
               << "whole milk,yogurt,other vegetables\n"
               << "soda\n"
               << "whole milk,rolls/buns,soda\n"
               << "yogurt,whole milk\n";

        std::ofstream single(single_path_);
        single << "transaction,item\n";
        const char* rows[][2] = {
            {"1", "whole milk"}, {"1", "rolls/buns"}, {"1", "yogurt"},
            {"2", "whole milk"}, {"2", "rolls/buns"},
            {"3", "other vegetables"}, {"3", "whole milk"},
            {"4", "rolls/buns"}, {"4", "soda"},
            {"5", "whole milk"}, {"5", "yogurt"}, {"5", "other vegetables"},
            {"6", "soda"},
            {"7", "whole milk"}, {"7", "rolls/buns"}, {"7", "soda"},
            {"8", "yogurt"}, {"8", "whole milk"},
        };
        for (const auto& row : rows) {
            single << row[0] << "," << row[1] << "\n";
        }
    }

    std::string basket_path_;
    std::string single_path_;
    std::string db_path_;
};

// ============================================================================
// File -> Store -> Engine
// ============================================================================

TEST_F(IntegrationTest, BothFileLayoutsGiveTheSameStore) {
    WriteGroceries();

    BasketReader basket_reader;
    TransactionStore from_basket = basket_reader.LoadFile(basket_path_);

    BasketReader::Config single_config;
    single_config.format = DatasetFormat::SINGLE;
    single_config.has_header = true;
    TransactionStore from_single = BasketReader(single_config).LoadFile(single_path_);

    EXPECT_EQ(from_basket.Dictionary().Labels(), from_single.Dictionary().Labels());
    EXPECT_EQ(from_basket.Transactions(), from_single.Transactions());
}

TEST_F(IntegrationTest, GroceryPipeline) {
    WriteGroceries();
    TransactionStore store = BasketReader().LoadFile(basket_path_);
    ASSERT_EQ(8u, store.TransactionCount());
    ASSERT_EQ(5u, store.ItemCount());

    RuleMiningEngine::Config config;
    config.mining.min_support = 0.25;
    config.rules.min_confidence = 0.5;
    config.sort_by = SortKey::CONFIDENCE;
    RuleMiningEngine engine(config);

    MiningResult result = engine.Run(store);

    ItemID milk = *store.Dictionary().Find("whole milk");
    ItemID yogurt = *store.Dictionary().Find("yogurt");

    // yogurt appears 3 times, always with whole milk
    auto it = std::find_if(result.rules.begin(), result.rules.end(),
        [&](const AssociationRule& rule) {
            return rule.Antecedent() == Itemset{yogurt} && rule.Consequent() == Itemset{milk};
        });
    ASSERT_NE(result.rules.end(), it);
    EXPECT_DOUBLE_EQ(1.0, it->Confidence());
    EXPECT_DOUBLE_EQ(3.0 / 8.0, it->Support());
    EXPECT_DOUBLE_EQ(8.0 / 6.0, it->Lift());

    // Sorted by confidence
    for (size_t i = 1; i < result.rules.Size(); ++i) {
        EXPECT_GE(result.rules[i - 1].Confidence(), result.rules[i].Confidence());
    }
}

TEST_F(IntegrationTest, EngineMatchesBruteForce) {
    TransactionStore store = LoadTransactions(GenerateBaskets(400, 10, 7));

    for (double min_support : {0.02, 0.05, 0.1}) {
        FrequentItemsetMiner::Config config;
        config.min_support = min_support;
        FrequentItemsetMiner miner(config);
        auto found = miner.Mine(store);

        uint32_t min_count = FrequentItemsetMiner::MinSupportCount(min_support, store.TransactionCount());
        auto expected = BruteForceItemsets(store, min_count);

        std::map<Itemset, uint32_t> actual;
        for (const auto& f : found) {
            actual.emplace(f.items, f.support_count);
        }
        EXPECT_EQ(expected, actual) << "min_support=" << min_support;
    }
}

TEST_F(IntegrationTest, CorrelatedPairProducesStrongRule) {
    TransactionStore store = LoadTransactions(GenerateBaskets(1000, 12, 3));
    ItemID item0 = *store.Dictionary().Find("item0");
    ItemID item1 = *store.Dictionary().Find("item1");

    RuleSet rules = GenerateRules(MineFrequentItemsets(store, 0.05), store, 0.6);
    RuleSet from_item0 = rules.WithAntecedentItem(item0).WithConsequentItem(item1);

    ASSERT_FALSE(from_item0.IsEmpty());
    EXPECT_GT(from_item0.TopN(1, SortKey::LIFT)[0].Lift(), 1.0);
}

TEST_F(IntegrationTest, ParallelScanMatchesSerialPipeline) {
    TransactionStore store = LoadTransactions(GenerateBaskets(2000, 15, 11));

    RuleMiningEngine::Config serial;
    serial.mining.min_support = 0.02;
    serial.rules.min_confidence = 0.3;
    serial.remove_redundant = true;

    RuleMiningEngine::Config parallel = serial;
    parallel.mining.counting = CountingStrategy::TRANSACTION_SCAN;
    parallel.mining.num_threads = 4;
    parallel.rules.prune_consequents = true;

    RuleMiningEngine serial_engine(serial);
    RuleMiningEngine parallel_engine(parallel);
    MiningResult a = serial_engine.Run(store);
    MiningResult b = parallel_engine.Run(store);

    EXPECT_EQ(a.itemsets, b.itemsets);
    EXPECT_EQ(a.rules.Size(), b.rules.Size());
    EXPECT_EQ(a.redundant.Size(), b.redundant.Size());
}

// ============================================================================
// Persistence round trip
// ============================================================================

TEST_F(IntegrationTest, PersistAndReloadGivesSameRules) {
    WriteGroceries();
    TransactionStore store = BasketReader().LoadFile(basket_path_);

    RuleMiningEngine::Config config;
    config.mining.min_support = 0.2;
    config.rules.min_confidence = 0.4;
    RuleMiningEngine engine(config);
    MiningResult result = engine.Run(store);

    {
        PersistentBackend::Config storage;
        storage.db_path = db_path_;
        PersistentBackend backend(storage);
        ASSERT_TRUE(backend.SaveDataset("groceries", store));
        ASSERT_TRUE(backend.SaveRuleSet("groceries", "default", result.rules,
                                        RuleSetParams{0.2, 0.4}));
    }

    PersistentBackend::Config storage;
    storage.db_path = db_path_;
    PersistentBackend backend(storage);

    auto reloaded = backend.LoadDataset("groceries");
    ASSERT_TRUE(reloaded.has_value());
    auto stored_rules = backend.LoadRuleSet("groceries", "default");
    ASSERT_TRUE(stored_rules.has_value());
    EXPECT_EQ(result.rules, *stored_rules);

    // Mining the reloaded dataset reproduces the stored rules
    RuleMiningEngine again(config);
    EXPECT_EQ(*stored_rules, again.Run(*reloaded).rules);
}

TEST_F(IntegrationTest, CsvExportOfRestrictedRules) {
    WriteGroceries();
    TransactionStore store = BasketReader().LoadFile(basket_path_);

    RuleSet rules = GenerateRules(MineFrequentItemsets(store, 0.2), store, 0.4);
    ItemSet milk = {*store.Dictionary().Find("whole milk")};
    RuleSet to_milk = RestrictAppearance(rules, std::nullopt, milk);

    std::ostringstream csv;
    to_milk.SortBy(SortKey::LIFT).WriteCsv(csv, store.Dictionary());

    std::istringstream lines(csv.str());
    std::string line;
    size_t count = 0;
    std::getline(lines, line);
    EXPECT_EQ("rules,support,confidence,lift,count", line);
    while (std::getline(lines, line)) {
        EXPECT_NE(std::string::npos, line.find("=> {whole milk}\""));
        ++count;
    }
    EXPECT_EQ(to_milk.Size(), count);
    EXPECT_GT(count, 0u);
}
