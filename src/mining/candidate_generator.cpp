// File: src/mining/candidate_generator.cpp
#include "mining/candidate_generator.hpp"
#include <algorithm>

namespace arminer {

namespace {

bool SharePrefix(const Itemset& a, const Itemset& b) {
    // Compare all but the last item
    return std::equal(a.begin(), a.end() - 1, b.begin());
}

} // namespace

std::vector<Itemset> CandidateGenerator::Join(const std::vector<Itemset>& level) {
    std::vector<Itemset> joined;
    if (level.empty() || level.front().empty()) {
        return joined;
    }

    size_t run_start = 0;
    while (run_start < level.size()) {
        // Find the run of itemsets sharing the (k-2)-prefix
        size_t run_end = run_start + 1;
        while (run_end < level.size() && SharePrefix(level[run_start], level[run_end])) {
            ++run_end;
        }

        for (size_t i = run_start; i < run_end; ++i) {
            for (size_t j = i + 1; j < run_end; ++j) {
                Itemset candidate = level[i];
                candidate.push_back(level[j].back());
                joined.push_back(std::move(candidate));
            }
        }

        run_start = run_end;
    }

    return joined;
}

bool CandidateGenerator::AllSubsetsPresent(const Itemset& candidate,
                                           const std::vector<Itemset>& level) {
    if (candidate.size() < 3) {
        return true;  // Both 1-subsets are the join parents
    }

    Itemset subset(candidate.size() - 1);
    for (size_t skip = 0; skip + 2 < candidate.size(); ++skip) {
        std::copy(candidate.begin(), candidate.begin() + skip, subset.begin());
        std::copy(candidate.begin() + skip + 1, candidate.end(), subset.begin() + skip);

        if (!std::binary_search(level.begin(), level.end(), subset)) {
            return false;
        }
    }
    return true;
}

CandidateBatch CandidateGenerator::Generate(const std::vector<Itemset>& level) {
    CandidateBatch batch;

    for (auto& candidate : Join(level)) {
        if (AllSubsetsPresent(candidate, level)) {
            batch.candidates.push_back(std::move(candidate));
        } else {
            ++batch.pruned;
        }
    }

    return batch;
}

} // namespace arminer
