// File: examples/constrained_rules.cpp
//
// Constrained Rule Mining Example
//
// This example demonstrates restricting which items may appear on which side
// of a rule:
//   - Targeting a single consequent during generation
//   - Listing items per side with Appearance::FromLabels
//   - Excluding items from rules altogether
//   - Post-filtering an existing rule set
//
// The scenario is a small clinical-style table where each transaction holds
// attribute values and an outcome; only rules predicting the outcome matter.

#include <iostream>
#include <string>
#include <vector>
#include "core/mining_api.hpp"
#include "core/rule_mining_engine.hpp"

using namespace arminer;

void PrintRules(const std::string& title, const RuleSet& rules, const ItemDictionary& dictionary) {
    std::cout << "\n=== " << title << " (" << rules.Size() << ") ===" << std::endl;
    for (const auto& rule : rules) {
        std::cout << "  " << rule.ToString(dictionary)
                  << "  conf=" << rule.Confidence()
                  << "  lift=" << rule.Lift() << std::endl;
    }
}

int main() {
    std::cout << "Constrained Rule Mining Example" << std::endl;

    TransactionStore store = LoadTransactions({
        {"age=young", "smoker=yes", "bp=high", "outcome=sick"},
        {"age=young", "smoker=no", "bp=normal", "outcome=healthy"},
        {"age=old", "smoker=yes", "bp=high", "outcome=sick"},
        {"age=old", "smoker=no", "bp=high", "outcome=sick"},
        {"age=young", "smoker=no", "bp=normal", "outcome=healthy"},
        {"age=old", "smoker=yes", "bp=normal", "outcome=sick"},
        {"age=young", "smoker=yes", "bp=normal", "outcome=healthy"},
        {"age=old", "smoker=no", "bp=normal", "outcome=healthy"},
        {"age=young", "smoker=yes", "bp=high", "outcome=sick"},
        {"age=old", "smoker=yes", "bp=high", "outcome=sick"},
    });

    const ItemDictionary& dictionary = store.Dictionary();

    RuleMiningEngine::Config config;
    config.mining.min_support = 0.2;
    config.rules.min_confidence = 0.7;
    config.sort_by = SortKey::LIFT;

    // 1. Unconstrained
    RuleMiningEngine all_engine(config);
    MiningResult all = all_engine.Run(store);
    std::cout << "Unconstrained run: " << all.rules.Size() << " rules" << std::endl;

    // 2. Only rules predicting "outcome=sick"
    ItemSet sick = dictionary.Resolve({"outcome=sick"});
    config.rules.appearance = Appearance::ForConsequents(sick);
    RuleMiningEngine sick_engine(config);
    MiningResult predictive = sick_engine.Run(store);
    PrintRules("Rules => outcome=sick", predictive.rules, dictionary);

    // 3. Outcomes on the right, age never used
    config.rules.appearance = Appearance::FromLabels(
        dictionary, Side::LHS,
        {},
        {"outcome=sick", "outcome=healthy"},
        {},
        {"age=young", "age=old"});
    RuleMiningEngine no_age_engine(config);
    MiningResult no_age = no_age_engine.Run(store);
    PrintRules("Outcome rules without age", no_age.rules, dictionary);

    std::cout << "Itemsets skipped for excluded items: "
              << no_age_engine.GetStatistics().generation.itemsets_skipped << std::endl;

    // 4. The same restriction applied after the fact
    RuleSet filtered = RestrictAppearance(all.rules, *config.rules.appearance);
    std::cout << "\nPost-filtered unconstrained rules: " << filtered.Size()
              << " (generation-time: " << no_age.rules.Size() << ")" << std::endl;

    // 5. Antecedent/consequent item lists, as used interactively
    ItemSet lhs = dictionary.Resolve({"smoker=yes", "bp=high"});
    RuleSet smoking = RestrictAppearance(all.rules, lhs, std::nullopt);
    PrintRules("Rules explained by smoking or blood pressure", smoking, dictionary);

    std::cout << "\nDone." << std::endl;
    return 0;
}
