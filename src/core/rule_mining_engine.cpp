// File: src/core/rule_mining_engine.cpp
#include "core/rule_mining_engine.hpp"
#include <string>
#include <utility>

namespace arminer {

namespace {

std::chrono::microseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

RuleMiningEngine::RuleMiningEngine()
    : RuleMiningEngine(Config())
{
}

RuleMiningEngine::RuleMiningEngine(const Config& config)
    : config_(config)
{
    // Fail fast before any store is touched
    FrequentItemsetMiner::ValidateConfig(config_.mining);
    RuleGenerator::ValidateConfig(config_.rules);
}

// ============================================================================
// Pipeline
// ============================================================================

std::vector<FrequentItemset> RuleMiningEngine::MineItemsets(const TransactionStore& store) {
    FrequentItemsetMiner::Config mining_config = config_.mining;
    mining_config.debug_logging = mining_config.debug_logging || config_.debug_logging;

    FrequentItemsetMiner miner(mining_config);
    miner.SetDebugStream(debug_stream_);

    auto start = std::chrono::steady_clock::now();
    auto itemsets = miner.Mine(store);
    stats_.mining_time = ElapsedSince(start);
    stats_.mining = miner.GetStatistics();
    stats_.itemsets_found = itemsets.size();

    return itemsets;
}

MiningResult RuleMiningEngine::Run(const TransactionStore& store) {
    stats_ = Statistics{};
    stats_.total_runs = 1;

    MiningResult result;
    result.itemsets = MineItemsets(store);
    result.aborted = stats_.mining.aborted;

    // Rules
    RuleGenerator::Config rule_config = config_.rules;
    rule_config.debug_logging = rule_config.debug_logging || config_.debug_logging;

    RuleGenerator generator(rule_config);
    generator.SetDebugStream(debug_stream_);

    auto start = std::chrono::steady_clock::now();
    RuleSet rules = generator.Generate(result.itemsets, store);
    stats_.rule_time = ElapsedSince(start);
    stats_.generation = generator.GetStatistics();
    stats_.rules_generated = rules.Size();

    // Redundancy
    if (config_.remove_redundant) {
        start = std::chrono::steady_clock::now();
        RedundancyPartition partition = RedundancyFilter::Partition(rules);
        stats_.filter_time = ElapsedSince(start);
        stats_.redundant_removed = partition.redundant.Size();

        rules = std::move(partition.non_redundant);
        result.redundant = std::move(partition.redundant);
    }

    if (config_.sort_by) {
        rules = rules.SortBy(*config_.sort_by);
    }
    result.rules = std::move(rules);

    LogDebug(std::to_string(result.itemsets.size()) + " itemsets, " +
             std::to_string(stats_.rules_generated) + " rules, " +
             std::to_string(stats_.redundant_removed) + " redundant" +
             (result.aborted ? " (mining aborted)" : ""));

    return result;
}

void RuleMiningEngine::LogDebug(const std::string& message) const {
    if (config_.debug_logging && debug_stream_) {
        *debug_stream_ << "[RuleMiningEngine] " << message << std::endl;
    }
}

} // namespace arminer
