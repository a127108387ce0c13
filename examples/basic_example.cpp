// File: examples/basic_example.cpp
//
// Basic association rule mining example using ARMiner.
// Demonstrates:
// - Loading a small grocery transaction database
// - Mining frequent itemsets and rules with RuleMiningEngine
// - Ranking rules by confidence and lift
// - Removing redundant rules
// - Viewing statistics

#include "core/rule_mining_engine.hpp"
#include <iostream>
#include <algorithm>
#include <iomanip>
#include <vector>

using namespace arminer;

void PrintRules(const RuleSet& rules, const ItemDictionary& dictionary, size_t limit) {
    size_t shown = std::min(limit, rules.Size());
    for (size_t i = 0; i < shown; ++i) {
        const AssociationRule& rule = rules[i];
        std::cout << "  " << std::left << std::setw(42) << rule.ToString(dictionary) << std::right
                  << std::fixed << std::setprecision(3)
                  << " supp " << rule.Support()
                  << "  conf " << rule.Confidence()
                  << "  lift " << rule.Lift() << "\n";
    }
    if (rules.Size() > shown) {
        std::cout << "  ... " << (rules.Size() - shown) << " more\n";
    }
}

int main() {
    std::cout << "=== ARMiner Basic Association Rule Example ===\n\n";

    // Step 1: Load transactions
    std::cout << "Step 1: Loading transactions...\n";

    TransactionStore store = TransactionStore::Load({
        {"whole milk", "rolls/buns", "yogurt"},
        {"whole milk", "rolls/buns"},
        {"other vegetables", "whole milk", "root vegetables"},
        {"rolls/buns", "soda"},
        {"whole milk", "yogurt", "other vegetables"},
        {"soda", "bottled water"},
        {"whole milk", "rolls/buns", "soda"},
        {"yogurt", "whole milk", "tropical fruit"},
        {"other vegetables", "root vegetables", "whole milk"},
        {"tropical fruit", "yogurt"},
        {"bottled water", "soda", "rolls/buns"},
        {"whole milk", "other vegetables"},
    });

    DatasetSummary summary = store.Summarize();
    std::cout << "  ✓ " << summary.transaction_count << " transactions, "
              << summary.item_count << " items, mean length "
              << std::setprecision(2) << std::fixed << summary.mean_transaction_length << "\n\n";

    // Step 2: Configure the engine
    std::cout << "Step 2: Configuring RuleMiningEngine...\n";

    RuleMiningEngine::Config config;
    config.mining.min_support = 0.15;
    config.rules.min_confidence = 0.6;
    config.sort_by = SortKey::CONFIDENCE;

    RuleMiningEngine engine(config);
    std::cout << "  ✓ min_support " << config.mining.min_support
              << ", min_confidence " << config.rules.min_confidence << "\n\n";

    // Step 3: Mine
    std::cout << "Step 3: Mining...\n";

    MiningResult result = engine.Run(store);
    std::cout << "  ✓ " << result.itemsets.size() << " frequent itemsets\n";
    for (const auto& itemset : result.itemsets) {
        std::cout << "    " << std::left << std::setw(36) << store.Dictionary().Format(itemset.items)
                  << std::right << " support " << std::setprecision(3) << itemset.Support() << "\n";
    }
    std::cout << "\n";

    // Step 4: Rules by confidence, then by lift
    std::cout << "Step 4: Rules by confidence (" << result.rules.Size() << " total)\n";
    PrintRules(result.rules, store.Dictionary(), 10);

    std::cout << "\nTop rules by lift:\n";
    PrintRules(result.rules.TopN(5, SortKey::LIFT), store.Dictionary(), 5);
    std::cout << "\n";

    // Step 5: Redundancy
    std::cout << "Step 5: Removing redundant rules...\n";

    config.remove_redundant = true;
    RuleMiningEngine pruning_engine(config);
    MiningResult pruned = pruning_engine.Run(store);
    std::cout << "  ✓ " << pruned.rules.Size() << " rules kept, "
              << pruned.redundant.Size() << " redundant\n\n";

    // Step 6: Statistics
    std::cout << "Step 6: Statistics\n";
    const auto& stats = pruning_engine.GetStatistics();
    std::cout << "  Minimum support count: " << stats.mining.min_support_count << "\n";
    for (const auto& level : stats.mining.levels) {
        std::cout << "  Level " << level.level << ": " << level.candidates_generated
                  << " candidates, " << level.candidates_pruned << " pruned, "
                  << level.frequent_found << " frequent\n";
    }
    std::cout << "  Mining time: " << stats.mining_time.count() << " us\n";
    std::cout << "  Rule time: " << stats.rule_time.count() << " us\n";

    std::cout << "\n=== Example completed successfully ===\n";
    return 0;
}
