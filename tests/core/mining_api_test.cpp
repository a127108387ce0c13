// File: tests/core/mining_api_test.cpp
//
// End-to-end behaviour of the flat mining interface on small datasets
// whose supports can be checked by hand.

#include "core/mining_api.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>

namespace arminer {
namespace {

class MiningApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<TransactionStore>(LoadTransactions({
            {"milk", "bread"},
            {"milk", "bread", "butter"},
            {"milk"},
            {"bread", "butter"},
        }));
    }

    ItemID Id(const std::string& label) const {
        return *store_->Dictionary().Find(label);
    }

    const FrequentItemset* FindItemset(const std::vector<FrequentItemset>& itemsets,
                                       std::vector<std::string> labels) const {
        Itemset items;
        for (const auto& label : labels) {
            items.push_back(Id(label));
        }
        Normalize(items);
        auto it = std::find_if(itemsets.begin(), itemsets.end(),
            [&items](const FrequentItemset& f) { return f.items == items; });
        return it == itemsets.end() ? nullptr : &*it;
    }

    const AssociationRule* FindRule(const RuleSet& rules,
                                    const std::string& antecedent,
                                    const std::string& consequent) const {
        Itemset a{Id(antecedent)};
        Itemset c{Id(consequent)};
        for (const auto& rule : rules) {
            if (rule.Antecedent() == a && rule.Consequent() == c) {
                return &rule;
            }
        }
        return nullptr;
    }

    std::unique_ptr<TransactionStore> store_;
};

// ============================================================================
// Frequent itemsets
// ============================================================================

TEST_F(MiningApiTest, GroceryItemsetSupports) {
    auto itemsets = MineFrequentItemsets(*store_, 0.5);

    const auto* milk = FindItemset(itemsets, {"milk"});
    const auto* bread = FindItemset(itemsets, {"bread"});
    const auto* milk_bread = FindItemset(itemsets, {"milk", "bread"});

    ASSERT_NE(nullptr, milk);
    ASSERT_NE(nullptr, bread);
    ASSERT_NE(nullptr, milk_bread);
    EXPECT_DOUBLE_EQ(0.75, milk->Support());
    EXPECT_DOUBLE_EQ(0.75, bread->Support());
    EXPECT_DOUBLE_EQ(0.5, milk_bread->Support());

    // {milk,butter} occurs once: below 0.5
    EXPECT_EQ(nullptr, FindItemset(itemsets, {"milk", "butter"}));
    EXPECT_EQ(5u, itemsets.size());
}

TEST_F(MiningApiTest, EverySubsetOfFrequentItemsetIsFrequent) {
    auto itemsets = MineFrequentItemsets(*store_, 0.25);

    for (const auto& f : itemsets) {
        for (size_t skip = 0; f.items.size() > 1 && skip < f.items.size(); ++skip) {
            Itemset subset;
            for (size_t i = 0; i < f.items.size(); ++i) {
                if (i != skip) subset.push_back(f.items[i]);
            }
            bool found = std::any_of(itemsets.begin(), itemsets.end(),
                [&subset](const FrequentItemset& g) { return g.items == subset; });
            EXPECT_TRUE(found) << "missing subset " << ToString(subset);
        }
    }
}

TEST_F(MiningApiTest, LengthBoundsFilterOutput) {
    auto pairs = MineFrequentItemsets(*store_, 0.25, 2, 2);

    ASSERT_FALSE(pairs.empty());
    for (const auto& f : pairs) {
        EXPECT_EQ(2u, f.Size());
    }
}

TEST_F(MiningApiTest, InvalidSupportThrows) {
    EXPECT_THROW(MineFrequentItemsets(*store_, 1.5), InvalidParameterError);
    EXPECT_THROW(MineFrequentItemsets(*store_, 0.0), InvalidParameterError);
    EXPECT_THROW(MineFrequentItemsets(*store_, -0.1), InvalidParameterError);
}

TEST_F(MiningApiTest, InvalidLengthBoundsThrow) {
    EXPECT_THROW(MineFrequentItemsets(*store_, 0.5, 3, 2), InvalidParameterError);
}

TEST(MiningApiLoadTest, EmptyDatasetThrows) {
    EXPECT_THROW(LoadTransactions({}), EmptyDatasetError);
}

// ============================================================================
// Rules
// ============================================================================

TEST_F(MiningApiTest, MilkBreadRuleMeasures) {
    auto itemsets = MineFrequentItemsets(*store_, 0.5);
    RuleSet rules = GenerateRules(itemsets, *store_, 0.5);

    const auto* rule = FindRule(rules, "milk", "bread");
    ASSERT_NE(nullptr, rule);
    EXPECT_DOUBLE_EQ(0.5, rule->Support());
    EXPECT_NEAR(2.0 / 3.0, rule->Confidence(), 1e-12);
    EXPECT_NEAR(8.0 / 9.0, rule->Lift(), 1e-12);
}

TEST_F(MiningApiTest, AllRulesMeetConfidence) {
    auto itemsets = MineFrequentItemsets(*store_, 0.25);
    RuleSet rules = GenerateRules(itemsets, *store_, 0.6);

    ASSERT_FALSE(rules.IsEmpty());
    for (const auto& rule : rules) {
        EXPECT_GE(rule.Confidence(), 0.6);
        EXPECT_LE(rule.Confidence(), 1.0);
        EXPECT_GE(rule.Lift(), 0.0);
    }
}

TEST(MiningApiLiftTest, LiftIsOneExactlyForIndependentPairs) {
    // x and y co-occur exactly as often as chance predicts (2 * 8 == 4 * 4);
    // p and q always occur together
    TransactionStore store = LoadTransactions({
        {"x", "y", "p", "q"},
        {"x", "y", "p", "q"},
        {"x", "p", "q"},
        {"x"},
        {"y"},
        {"y"},
        {"z"},
        {"z"},
    });
    RuleSet rules = GenerateRules(MineFrequentItemsets(store, 0.2), store, 0.1);
    ASSERT_FALSE(rules.IsEmpty());

    size_t independent_rules = 0;
    size_t dependent_rules = 0;
    for (const auto& rule : rules) {
        ASSERT_EQ(store.SupportCount(Union(rule.Antecedent(), rule.Consequent())),
                  rule.SupportCount());
        ASSERT_EQ(store.SupportCount(rule.Antecedent()), rule.AntecedentCount());
        ASSERT_EQ(store.SupportCount(rule.Consequent()), rule.ConsequentCount());

        uint64_t joint = uint64_t{rule.SupportCount()} * rule.TransactionCount();
        uint64_t chance = uint64_t{rule.AntecedentCount()} * rule.ConsequentCount();
        bool independent = (joint == chance);

        EXPECT_EQ(independent, std::abs(rule.Lift() - 1.0) < 1e-12)
            << rule.ToString(store.Dictionary()) << " lift=" << rule.Lift();
        if (independent) {
            ++independent_rules;
        } else {
            ++dependent_rules;
        }
    }
    EXPECT_GT(independent_rules, 0u);
    EXPECT_GT(dependent_rules, 0u);

    ItemID x = *store.Dictionary().Find("x");
    ItemID y = *store.Dictionary().Find("y");
    ItemID p = *store.Dictionary().Find("p");
    ItemID q = *store.Dictionary().Find("q");
    for (const auto& rule : rules) {
        if (rule.Antecedent() == Itemset{x} && rule.Consequent() == Itemset{y}) {
            EXPECT_NEAR(1.0, rule.Lift(), 1e-12);
        }
        if (rule.Antecedent() == Itemset{p} && rule.Consequent() == Itemset{q}) {
            EXPECT_NEAR(8.0 / 3.0, rule.Lift(), 1e-12);
        }
    }
    EXPECT_EQ(1u, rules.Filter([&](const AssociationRule& r) {
        return r.Antecedent() == Itemset{x} && r.Consequent() == Itemset{y};
    }).Size());
    EXPECT_EQ(1u, rules.Filter([&](const AssociationRule& r) {
        return r.Antecedent() == Itemset{p} && r.Consequent() == Itemset{q};
    }).Size());
}

TEST_F(MiningApiTest, InvalidConfidenceThrows) {
    auto itemsets = MineFrequentItemsets(*store_, 0.5);
    EXPECT_THROW(GenerateRules(itemsets, *store_, 0.0), InvalidParameterError);
    EXPECT_THROW(GenerateRules(itemsets, *store_, 1.01), InvalidParameterError);
}

TEST_F(MiningApiTest, RestrictToAbsentConsequentIsEmpty) {
    auto itemsets = MineFrequentItemsets(*store_, 0.5);
    RuleSet rules = GenerateRules(itemsets, *store_, 0.5);

    // "caviar" never occurs; resolving it yields an empty allowed set
    ItemSet rhs = store_->Dictionary().Resolve({"caviar"});
    RuleSet restricted = RestrictAppearance(rules, std::nullopt, rhs);

    EXPECT_TRUE(restricted.IsEmpty());
}

TEST_F(MiningApiTest, RestrictToFullUniverseKeepsEverything) {
    auto itemsets = MineFrequentItemsets(*store_, 0.25);
    RuleSet rules = GenerateRules(itemsets, *store_, 0.3);

    Itemset items = store_->Items();
    ItemSet all(items.begin(), items.end());
    EXPECT_EQ(rules, RestrictAppearance(rules, all, all));
}

TEST_F(MiningApiTest, RestrictConsequentToBread) {
    auto itemsets = MineFrequentItemsets(*store_, 0.5);
    RuleSet rules = GenerateRules(itemsets, *store_, 0.5);

    RuleSet restricted = RestrictAppearance(rules, std::nullopt, ItemSet{Id("bread")});

    ASSERT_FALSE(restricted.IsEmpty());
    for (const auto& rule : restricted) {
        EXPECT_EQ(Itemset{Id("bread")}, rule.Consequent());
    }
}

TEST_F(MiningApiTest, FilterRedundantIsIdempotent) {
    auto itemsets = MineFrequentItemsets(*store_, 0.25);
    RuleSet rules = GenerateRules(itemsets, *store_, 0.3);

    auto first = FilterRedundant(rules);
    auto second = FilterRedundant(first.non_redundant);

    EXPECT_EQ(first.non_redundant, second.non_redundant);
    EXPECT_TRUE(second.redundant.IsEmpty());
    EXPECT_EQ(rules.Size(), first.non_redundant.Size() + first.redundant.Size());
}

TEST_F(MiningApiTest, TopNOrdersByMeasure) {
    auto itemsets = MineFrequentItemsets(*store_, 0.25);
    RuleSet rules = GenerateRules(itemsets, *store_, 0.3);

    RuleSet top = TopN(rules, 3, SortKey::CONFIDENCE);
    ASSERT_EQ(3u, top.Size());
    for (size_t i = 1; i < top.Size(); ++i) {
        EXPECT_GE(top[i - 1].Confidence(), top[i].Confidence());
    }
}

} // namespace
} // namespace arminer
