// File: src/core/mining_api.cpp
#include "core/mining_api.hpp"
#include "mining/frequent_itemset_miner.hpp"
#include "rules/rule_generator.hpp"

namespace arminer {

TransactionStore LoadTransactions(const std::vector<std::vector<std::string>>& transactions) {
    return TransactionStore::Load(transactions);
}

std::vector<FrequentItemset> MineFrequentItemsets(const TransactionStore& store,
                                                  double min_support,
                                                  size_t min_len,
                                                  size_t max_len) {
    FrequentItemsetMiner::Config config;
    config.min_support = min_support;
    config.min_len = min_len;
    config.max_len = max_len;

    FrequentItemsetMiner miner(config);
    return miner.Mine(store);
}

RuleSet GenerateRules(const std::vector<FrequentItemset>& itemsets,
                      const TransactionStore& store,
                      double min_confidence) {
    RuleGenerator::Config config;
    config.min_confidence = min_confidence;

    RuleGenerator generator(config);
    return generator.Generate(itemsets, store);
}

RedundancyPartition FilterRedundant(const RuleSet& rules) {
    return RedundancyFilter::Partition(rules);
}

RuleSet TopN(const RuleSet& rules, size_t n, SortKey key) {
    return rules.TopN(n, key);
}

} // namespace arminer
