// File: src/rules/redundancy_filter.cpp
#include "rules/redundancy_filter.hpp"
#include <algorithm>
#include <map>

namespace arminer {

std::vector<bool> RedundancyFilter::MarkRedundant(const RuleSet& rules) {
    std::vector<bool> redundant(rules.Size(), false);

    // Group rule indices by consequent
    std::map<Itemset, std::vector<size_t>> groups;
    for (size_t i = 0; i < rules.Size(); ++i) {
        groups[rules[i].Consequent()].push_back(i);
    }

    for (auto& group : groups) {
        std::vector<size_t>& indices = group.second;
        if (indices.size() < 2) {
            continue;
        }

        std::stable_sort(indices.begin(), indices.end(), [&rules](size_t a, size_t b) {
            return rules[a].Antecedent().size() < rules[b].Antecedent().size();
        });

        std::vector<size_t> confirmed;
        for (size_t idx : indices) {
            const AssociationRule& rule = rules[idx];

            bool dominated = std::any_of(confirmed.begin(), confirmed.end(),
                [&rules, &rule](size_t general_idx) {
                    const AssociationRule& general = rules[general_idx];
                    return IsStrictSubset(general.Antecedent(), rule.Antecedent()) &&
                           general.HasConfidenceAtLeast(rule);
                });

            if (dominated) {
                redundant[idx] = true;
            } else {
                confirmed.push_back(idx);
            }
        }
    }

    return redundant;
}

RedundancyPartition RedundancyFilter::Partition(const RuleSet& rules) {
    std::vector<bool> redundant = MarkRedundant(rules);

    std::vector<AssociationRule> kept;
    std::vector<AssociationRule> removed;
    for (size_t i = 0; i < rules.Size(); ++i) {
        if (redundant[i]) {
            removed.push_back(rules[i]);
        } else {
            kept.push_back(rules[i]);
        }
    }

    RedundancyPartition partition;
    partition.non_redundant = RuleSet(std::move(kept));
    partition.redundant = RuleSet(std::move(removed));
    return partition;
}

} // namespace arminer
