// File: src/mining/frequent_itemset_miner.cpp
#include "mining/frequent_itemset_miner.hpp"
#include "mining/candidate_generator.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <sstream>

namespace arminer {

namespace {

SupportCounter::Config MakeCounterConfig(const FrequentItemsetMiner::Config& config) {
    FrequentItemsetMiner::ValidateConfig(config);

    SupportCounter::Config counter_config;
    counter_config.strategy = config.counting;
    counter_config.num_threads = config.num_threads;
    return counter_config;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

FrequentItemsetMiner::FrequentItemsetMiner()
    : FrequentItemsetMiner(Config())
{
}

FrequentItemsetMiner::FrequentItemsetMiner(const Config& config)
    : config_(config),
      counter_(MakeCounterConfig(config))
{
}

void FrequentItemsetMiner::ValidateConfig(const Config& config) {
    if (!(config.min_support > 0.0 && config.min_support <= 1.0)) {
        std::ostringstream oss;
        oss << "min_support must be in (0, 1], got " << config.min_support;
        throw InvalidParameterError(oss.str());
    }
    if (config.min_len == 0) {
        throw InvalidParameterError("min_len must be at least 1");
    }
    if (config.min_len > config.max_len) {
        throw InvalidParameterError("min_len (" + std::to_string(config.min_len) +
                                    ") must not exceed max_len (" +
                                    std::to_string(config.max_len) + ")");
    }
    if (config.num_threads == 0) {
        throw InvalidParameterError("num_threads must be at least 1");
    }
    if (config.time_limit.count() < 0) {
        throw InvalidParameterError("time_limit must not be negative");
    }
}

uint32_t FrequentItemsetMiner::MinSupportCount(double min_support, size_t transaction_count) {
    // Tolerance keeps 0.5 * 4 at 2 despite binary rounding of min_support
    double threshold = std::ceil(min_support * static_cast<double>(transaction_count) - 1e-9);
    if (threshold < 1.0) {
        return 1;
    }
    return static_cast<uint32_t>(threshold);
}

// ============================================================================
// Mining
// ============================================================================

std::vector<FrequentItemset> FrequentItemsetMiner::Mine(const TransactionStore& store) {
    auto start = std::chrono::steady_clock::now();

    stats_ = Statistics();
    const uint32_t transaction_count = static_cast<uint32_t>(store.TransactionCount());
    const uint32_t min_count = MinSupportCount(config_.min_support, transaction_count);
    stats_.min_support_count = min_count;

    LogDebug("Mining " + std::to_string(transaction_count) + " transactions, " +
             std::to_string(store.ItemCount()) + " items, min support count " +
             std::to_string(min_count));

    std::vector<FrequentItemset> result;

    // Level 1: single items straight from the tid-lists
    std::vector<Itemset> level;
    std::vector<uint32_t> level_counts;
    {
        LevelStats level_stats;
        level_stats.level = 1;
        level_stats.candidates_generated = store.ItemCount();

        for (const auto& item : store.Items()) {
            uint32_t count = store.ItemSupportCount(item);
            if (count >= min_count) {
                level.push_back(Itemset{item});
                level_counts.push_back(count);
            }
        }

        level_stats.frequent_found = level.size();
        stats_.levels.push_back(level_stats);
        stats_.total_candidates += level_stats.candidates_generated;
    }

    size_t k = 1;
    while (!level.empty()) {
        stats_.total_frequent += level.size();

        if (k >= config_.min_len) {
            for (size_t i = 0; i < level.size(); ++i) {
                result.push_back(FrequentItemset{level[i], level_counts[i], transaction_count});
            }
        }

        LogDebug("Level " + std::to_string(k) + ": " + std::to_string(level.size()) +
                 " frequent itemsets");

        if (k >= config_.max_len) {
            break;
        }
        if (ShouldStop(start)) {
            stats_.aborted = true;
            LogDebug("Cancelled before level " + std::to_string(k + 1));
            break;
        }

        // Level k+1: join, prune, count
        LevelStats level_stats;
        level_stats.level = k + 1;

        CandidateBatch batch = CandidateGenerator::Generate(level);
        level_stats.candidates_generated = batch.candidates.size() + batch.pruned;
        level_stats.candidates_pruned = batch.pruned;

        std::vector<uint32_t> counts = counter_.Count(store, batch.candidates);

        if (ShouldStop(start)) {
            stats_.aborted = true;
            LogDebug("Cancelled during level " + std::to_string(k + 1) + ", discarding it");
            break;
        }

        std::vector<Itemset> next_level;
        std::vector<uint32_t> next_counts;
        for (size_t i = 0; i < batch.candidates.size(); ++i) {
            if (counts[i] >= min_count) {
                next_level.push_back(std::move(batch.candidates[i]));
                next_counts.push_back(counts[i]);
            }
        }

        level_stats.frequent_found = next_level.size();
        stats_.levels.push_back(level_stats);
        stats_.total_candidates += level_stats.candidates_generated;

        level.swap(next_level);
        level_counts.swap(next_counts);
        ++k;
    }

    stats_.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    LogDebug("Found " + std::to_string(result.size()) + " itemsets in " +
             std::to_string(stats_.elapsed.count()) + "us");

    return result;
}

bool FrequentItemsetMiner::ShouldStop(std::chrono::steady_clock::time_point start) const {
    if (config_.cancel_check && config_.cancel_check()) {
        return true;
    }
    if (config_.time_limit.count() > 0) {
        return std::chrono::steady_clock::now() - start >= config_.time_limit;
    }
    return false;
}

void FrequentItemsetMiner::LogDebug(const std::string& message) const {
    if (config_.debug_logging && debug_stream_) {
        *debug_stream_ << "[FrequentItemsetMiner] " << message << std::endl;
    }
}

} // namespace arminer
