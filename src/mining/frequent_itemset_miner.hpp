// File: src/mining/frequent_itemset_miner.hpp
#pragma once

#include "mining/frequent_itemset.hpp"
#include "mining/support_counter.hpp"
#include "storage/transaction_store.hpp"
#include <chrono>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace arminer {

/// FrequentItemsetMiner: Level-wise Apriori search for frequent itemsets
///
/// Level 1 counts single items from the store's tid-lists. Every further level
/// joins the previous level's frequent itemsets on their shared prefix, drops
/// candidates with an infrequent subset, and counts the survivors. The search
/// stops when a level yields nothing or max_len is reached.
///
/// The result holds every frequent itemset with min_len <= size <= max_len,
/// ordered by size and then lexicographically by ItemID. Levels below min_len
/// are mined but not returned.
///
/// A run can be cancelled between levels through Config::cancel_check or
/// Config::time_limit. The level in flight when cancellation is noticed is
/// discarded; completed levels are returned and Statistics::aborted is set.
///
/// Thread-safety: Not thread-safe. Use one miner per thread.
class FrequentItemsetMiner {
public:
    struct Config {
        Config() = default;

        /// Minimum relative support, in (0, 1]
        double min_support{0.1};

        /// Smallest itemset size returned (>= 1)
        size_t min_len{1};

        /// Largest itemset size searched
        size_t max_len{10};

        /// Support counting strategy and parallelism
        CountingStrategy counting{CountingStrategy::TIDLIST_INTERSECTION};
        size_t num_threads{1};

        /// Wall-clock bound checked between levels (0 = unlimited)
        std::chrono::milliseconds time_limit{0};

        /// Polled between levels; returning true aborts the run
        std::function<bool()> cancel_check;

        bool debug_logging{false};
    };

    /// Per-level search statistics
    struct LevelStats {
        size_t level{0};
        size_t candidates_generated{0};
        size_t candidates_pruned{0};
        size_t frequent_found{0};
    };

    struct Statistics {
        std::vector<LevelStats> levels;
        size_t total_candidates{0};
        size_t total_frequent{0};
        uint32_t min_support_count{0};
        std::chrono::microseconds elapsed{0};
        bool aborted{false};
    };

    FrequentItemsetMiner();

    /// @throws InvalidParameterError on invalid thresholds or length bounds
    explicit FrequentItemsetMiner(const Config& config);

    /// Mine all frequent itemsets of the store
    std::vector<FrequentItemset> Mine(const TransactionStore& store);

    /// Statistics of the last Mine() call
    const Statistics& GetStatistics() const { return stats_; }

    const Config& GetConfig() const { return config_; }

    /// Smallest support count satisfying min_support on `transaction_count`
    static uint32_t MinSupportCount(double min_support, size_t transaction_count);

    /// @throws InvalidParameterError describing the first invalid field
    static void ValidateConfig(const Config& config);

    /// Set stream for debug output (nullptr disables)
    void SetDebugStream(std::ostream* os) { debug_stream_ = os; }

private:
    Config config_;
    SupportCounter counter_;
    Statistics stats_;
    std::ostream* debug_stream_{nullptr};

    /// True if the run must stop before starting or accepting a level
    bool ShouldStop(std::chrono::steady_clock::time_point start) const;

    void LogDebug(const std::string& message) const;
};

} // namespace arminer
