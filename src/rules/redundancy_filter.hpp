// File: src/rules/redundancy_filter.hpp
#pragma once

#include "rules/rule_set.hpp"
#include <vector>

namespace arminer {

/// Rules split by redundancy, each part in the original relative order
struct RedundancyPartition {
    RuleSet non_redundant;
    RuleSet redundant;
};

/// RedundancyFilter: Removes rules implied by a more general rule
///
/// A rule A => C is redundant if the same rule set holds A' => C with A' a
/// strict subset of A and confidence(A' => C) >= confidence(A => C).
///
/// Rules are grouped by consequent and visited in ascending antecedent size.
/// Each rule is compared only with rules of its group already confirmed
/// non-redundant: if a redundant rule dominates R, whatever dominates that
/// rule dominates R as well. Confidences are compared exactly on support
/// counts. Filtering a non-redundant partition again returns it unchanged.
class RedundancyFilter {
public:
    /// Split rules into non-redundant and redundant parts
    static RedundancyPartition Partition(const RuleSet& rules);

    /// Per-rule flag: true if rules[i] is redundant
    static std::vector<bool> MarkRedundant(const RuleSet& rules);
};

} // namespace arminer
