// File: src/rules/rule_generator.cpp
#include "rules/rule_generator.hpp"
#include "mining/candidate_generator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <sstream>

namespace arminer {

// ============================================================================
// Construction
// ============================================================================

RuleGenerator::RuleGenerator()
    : RuleGenerator(Config())
{
}

RuleGenerator::RuleGenerator(const Config& config)
    : config_(config)
{
    ValidateConfig(config_);
}

void RuleGenerator::ValidateConfig(const Config& config) {
    if (!(config.min_confidence > 0.0 && config.min_confidence <= 1.0)) {
        std::ostringstream oss;
        oss << "min_confidence must be in (0, 1], got " << config.min_confidence;
        throw InvalidParameterError(oss.str());
    }
    if (config.appearance) {
        config.appearance->Validate();
    }
}

// ============================================================================
// Generation
// ============================================================================

RuleSet RuleGenerator::Generate(const std::vector<FrequentItemset>& itemsets,
                                const TransactionStore& store) {
    stats_ = Statistics();

    CountCache counts;
    counts.reserve(itemsets.size());
    for (const auto& itemset : itemsets) {
        counts.emplace(itemset.items, itemset.support_count);
    }

    std::vector<AssociationRule> rules;
    for (const auto& itemset : itemsets) {
        if (itemset.items.size() < 2) {
            continue;
        }
        GenerateForItemset(itemset, store, counts, rules);
    }

    stats_.rules_generated = rules.size();
    LogDebug("Generated " + std::to_string(rules.size()) + " rules from " +
             std::to_string(stats_.itemsets_examined) + " itemsets (" +
             std::to_string(stats_.candidates_evaluated) + " candidates, " +
             std::to_string(stats_.consequents_pruned) + " consequents pruned)");

    return RuleSet(std::move(rules));
}

void RuleGenerator::GenerateForItemset(const FrequentItemset& itemset,
                                       const TransactionStore& store,
                                       CountCache& counts,
                                       std::vector<AssociationRule>& rules) {
    const Itemset& items = itemset.items;
    const Appearance* appearance = config_.appearance ? &*config_.appearance : nullptr;

    if (appearance) {
        bool has_forbidden = std::any_of(items.begin(), items.end(), [appearance](ItemID item) {
            return appearance->SideOf(item) == Side::NONE;
        });
        if (has_forbidden) {
            ++stats_.itemsets_skipped;
            return;
        }
    }

    ++stats_.itemsets_examined;

    const uint32_t transaction_count = static_cast<uint32_t>(store.TransactionCount());
    const size_t max_consequent = config_.max_consequent_size == 0
        ? items.size() - 1
        : std::min(config_.max_consequent_size, items.size() - 1);

    // Size-1 consequents
    std::vector<Itemset> consequents;
    for (const auto& item : items) {
        if (!appearance || appearance->AllowsInConsequent(item)) {
            consequents.push_back(Itemset{item});
        }
    }

    for (size_t m = 1; m <= max_consequent && !consequents.empty(); ++m) {
        std::vector<Itemset> growable;
        growable.reserve(consequents.size());

        for (auto& consequent : consequents) {
            Itemset antecedent = Difference(items, consequent);
            uint32_t antecedent_count = LookupCount(antecedent, store, counts);
            ++stats_.candidates_evaluated;

            bool passes = antecedent_count > 0 &&
                          MeetsConfidence(itemset.support_count, antecedent_count);

            if (passes && (!appearance || appearance->AllowsAntecedent(antecedent))) {
                uint32_t consequent_count = LookupCount(consequent, store, counts);
                rules.emplace_back(std::move(antecedent), consequent,
                                   itemset.support_count, antecedent_count,
                                   consequent_count, transaction_count);
            }

            if (passes || !config_.prune_consequents) {
                growable.push_back(std::move(consequent));
            } else {
                ++stats_.consequents_pruned;
            }
        }

        if (m == max_consequent) {
            break;
        }
        consequents = CandidateGenerator::Generate(growable).candidates;
    }
}

uint32_t RuleGenerator::LookupCount(const Itemset& items,
                                    const TransactionStore& store,
                                    CountCache& counts) {
    auto it = counts.find(items);
    if (it != counts.end()) {
        return it->second;
    }

    ++stats_.store_lookups;
    uint32_t count = store.SupportCount(items);
    counts.emplace(items, count);
    return count;
}

bool RuleGenerator::MeetsConfidence(uint32_t support_count, uint32_t antecedent_count) const {
    double confidence = static_cast<double>(support_count) / antecedent_count;
    return confidence + 1e-12 >= config_.min_confidence;
}

void RuleGenerator::LogDebug(const std::string& message) const {
    if (config_.debug_logging && debug_stream_) {
        *debug_stream_ << "[RuleGenerator] " << message << std::endl;
    }
}

} // namespace arminer
