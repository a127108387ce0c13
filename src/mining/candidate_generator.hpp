// File: src/mining/candidate_generator.hpp
#pragma once

#include "core/types.hpp"
#include <vector>

namespace arminer {

/// Result of one apriori-gen step
struct CandidateBatch {
    /// Candidates that survived the subset check, in lexicographic order
    std::vector<Itemset> candidates;

    /// Joined candidates that had an infrequent (k-1)-subset
    size_t pruned{0};
};

/// CandidateGenerator: apriori-gen over a level of frequent itemsets
///
/// Join: two (k-1)-itemsets sharing their first k-2 items produce the k-itemset
/// prefix + {last_a, last_b} with last_a < last_b. Because the input is sorted
/// lexicographically, itemsets sharing a prefix form a contiguous run, and every
/// candidate is produced exactly once.
///
/// Prune: a candidate is dropped if any (k-1)-subset is not in the input level
/// (anti-monotonicity of support). The two subsets obtained by removing one of
/// the last two items are the join parents and need no check.
class CandidateGenerator {
public:
    /// Generate k-candidates from the frequent (k-1)-itemsets
    /// @param level Frequent itemsets of equal size, sorted lexicographically
    /// @return Surviving candidates, sorted lexicographically
    static CandidateBatch Generate(const std::vector<Itemset>& level);

    /// Join step only (no subset pruning)
    static std::vector<Itemset> Join(const std::vector<Itemset>& level);

    /// True if every (k-1)-subset of `candidate` is in the sorted `level`
    static bool AllSubsetsPresent(const Itemset& candidate, const std::vector<Itemset>& level);
};

} // namespace arminer
