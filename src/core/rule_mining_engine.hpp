// File: src/core/rule_mining_engine.hpp
#pragma once

#include "mining/frequent_itemset_miner.hpp"
#include "rules/redundancy_filter.hpp"
#include "rules/rule_generator.hpp"
#include "rules/rule_set.hpp"
#include "storage/transaction_store.hpp"
#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace arminer {

/// Output of one end-to-end mining run
struct MiningResult {
    /// Frequent itemsets within the configured length bounds
    std::vector<FrequentItemset> itemsets;

    /// Final rules (non-redundant if redundancy removal is enabled)
    RuleSet rules;

    /// Rules removed as redundant (empty if removal is disabled)
    RuleSet redundant;

    /// True if itemset mining was cancelled before completing all levels
    bool aborted{false};
};

/// RuleMiningEngine: Runs the full mining pipeline on a transaction store
///
/// Pipeline: frequent itemsets -> rule generation (with optional appearance
/// restriction) -> optional redundancy removal -> optional final ordering.
class RuleMiningEngine {
public:
    struct Config {
        Config() = default;

        FrequentItemsetMiner::Config mining;
        RuleGenerator::Config rules;

        /// Move redundant rules to MiningResult::redundant
        bool remove_redundant{false};

        /// Final ordering of MiningResult::rules (generation order if unset)
        std::optional<SortKey> sort_by;

        bool debug_logging{false};
    };

    struct Statistics {
        FrequentItemsetMiner::Statistics mining;
        RuleGenerator::Statistics generation;
        size_t itemsets_found{0};
        size_t rules_generated{0};
        size_t redundant_removed{0};
        std::chrono::microseconds mining_time{0};
        std::chrono::microseconds rule_time{0};
        std::chrono::microseconds filter_time{0};
        size_t total_runs{0};
    };

    RuleMiningEngine();

    /// @throws InvalidParameterError on invalid mining or rule parameters
    explicit RuleMiningEngine(const Config& config);

    // Disable copy
    RuleMiningEngine(const RuleMiningEngine&) = delete;
    RuleMiningEngine& operator=(const RuleMiningEngine&) = delete;

    /// Run the pipeline
    MiningResult Run(const TransactionStore& store);

    /// Mine frequent itemsets only
    std::vector<FrequentItemset> MineItemsets(const TransactionStore& store);

    const Config& GetConfig() const { return config_; }
    const Statistics& GetStatistics() const { return stats_; }

    /// Set stream for debug output, forwarded to the miner and generator
    void SetDebugStream(std::ostream* os) { debug_stream_ = os; }

private:
    Config config_;
    Statistics stats_;
    std::ostream* debug_stream_{nullptr};

    void LogDebug(const std::string& message) const;
};

} // namespace arminer
