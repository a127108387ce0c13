// File: src/core/mining_api.hpp
//
// Flat function interface over the mining components.
// Each call takes caller-owned inputs and returns fresh values; nothing is
// kept between calls.

#pragma once

#include "mining/frequent_itemset.hpp"
#include "rules/appearance.hpp"
#include "rules/redundancy_filter.hpp"
#include "rules/rule_set.hpp"
#include "storage/transaction_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arminer {

/// Load a transaction database from item labels
/// @throws EmptyDatasetError if `transactions` is empty
TransactionStore LoadTransactions(const std::vector<std::vector<std::string>>& transactions);

/// All itemsets with support >= min_support and min_len <= size <= max_len
/// @throws InvalidParameterError if min_support is not in (0, 1] or min_len > max_len
std::vector<FrequentItemset> MineFrequentItemsets(const TransactionStore& store,
                                                  double min_support,
                                                  size_t min_len = 1,
                                                  size_t max_len = 10);

/// Rules with confidence >= min_confidence from frequent itemsets
/// @throws InvalidParameterError if min_confidence is not in (0, 1]
RuleSet GenerateRules(const std::vector<FrequentItemset>& itemsets,
                      const TransactionStore& store,
                      double min_confidence);

/// Split a rule set into non-redundant and redundant rules
RedundancyPartition FilterRedundant(const RuleSet& rules);

/// Highest `n` rules by `key`, stable, descending
RuleSet TopN(const RuleSet& rules, size_t n, SortKey key);

} // namespace arminer
