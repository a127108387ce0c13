// File: src/rules/rule_generator.hpp
#pragma once

#include "mining/frequent_itemset.hpp"
#include "rules/appearance.hpp"
#include "rules/rule_set.hpp"
#include "storage/transaction_store.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace arminer {

/// RuleGenerator: Expands frequent itemsets into association rules
///
/// For an itemset I the generator walks consequents level by level: first
/// every single item, then consequents of size 2 built by joining the size-1
/// consequents, and so on up to |I| - 1. Each consequent C yields the
/// candidate rule (I - C) => C, kept if its confidence reaches min_confidence.
///
/// Growing C shrinks the antecedent, and a smaller antecedent has support at
/// least as large, so confidence can only fall along this walk. With
/// prune_consequents enabled, a consequent whose rule fails the threshold is
/// not grown further. Without it every consequent is enumerated; both modes
/// produce the same rules.
///
/// An optional Appearance restricts the walk: itemsets with an item allowed on
/// neither side are skipped, consequents holding an item not allowed on the
/// consequent side are dropped (their supersets fail too), and rules whose
/// antecedent breaks the restriction are not emitted.
///
/// Thread-safety: Not thread-safe. Use one generator per thread.
class RuleGenerator {
public:
    struct Config {
        Config() = default;

        /// Minimum confidence, in (0, 1]
        double min_confidence{0.8};

        /// Stop growing consequents whose rule fails min_confidence
        bool prune_consequents{false};

        /// Largest consequent size (0 = up to |I| - 1)
        size_t max_consequent_size{0};

        /// Optional side restriction applied during generation
        std::optional<Appearance> appearance;

        bool debug_logging{false};
    };

    struct Statistics {
        size_t itemsets_examined{0};
        size_t itemsets_skipped{0};
        size_t candidates_evaluated{0};
        size_t consequents_pruned{0};
        size_t rules_generated{0};
        size_t store_lookups{0};
    };

    RuleGenerator();

    /// @throws InvalidParameterError on invalid min_confidence or appearance
    explicit RuleGenerator(const Config& config);

    /// Generate rules from frequent itemsets
    /// Supports of antecedents and consequents are taken from `itemsets` when
    /// present, otherwise counted in `store`.
    /// @param itemsets Frequent itemsets (any order, typically miner output)
    /// @param store Transaction database the itemsets were mined from
    RuleSet Generate(const std::vector<FrequentItemset>& itemsets,
                     const TransactionStore& store);

    const Statistics& GetStatistics() const { return stats_; }
    const Config& GetConfig() const { return config_; }

    /// @throws InvalidParameterError describing the first invalid field
    static void ValidateConfig(const Config& config);

    /// Set stream for debug output (nullptr disables)
    void SetDebugStream(std::ostream* os) { debug_stream_ = os; }

private:
    using CountCache = std::unordered_map<Itemset, uint32_t, ItemsetHash>;

    Config config_;
    Statistics stats_;
    std::ostream* debug_stream_{nullptr};

    /// Generate every rule of one itemset, appending to `rules`
    void GenerateForItemset(const FrequentItemset& itemset,
                            const TransactionStore& store,
                            CountCache& counts,
                            std::vector<AssociationRule>& rules);

    /// Support count from the cache, falling back to the store
    uint32_t LookupCount(const Itemset& items, const TransactionStore& store, CountCache& counts);

    bool MeetsConfidence(uint32_t support_count, uint32_t antecedent_count) const;

    void LogDebug(const std::string& message) const;
};

} // namespace arminer
