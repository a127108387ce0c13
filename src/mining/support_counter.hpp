// File: src/mining/support_counter.hpp
#pragma once

#include "core/types.hpp"
#include "storage/transaction_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace arminer {

/// How candidate support is counted
enum class CountingStrategy : uint8_t {
    TIDLIST_INTERSECTION = 0,  // Vertical: intersect per-item tid-lists
    TRANSACTION_SCAN = 1,      // Horizontal: scan transactions, shardable across threads
};

// Convert CountingStrategy to string ("tidlist" / "scan")
const char* ToString(CountingStrategy strategy);

// Parse CountingStrategy from string
CountingStrategy ParseCountingStrategy(const std::string& str);

/// SupportCounter: Counts how many transactions contain each candidate
///
/// TRANSACTION_SCAN splits the transaction range into contiguous shards, one
/// per worker thread. Each worker reads the immutable store and fills its own
/// count vector; the calling thread sums the vectors once all workers joined.
/// No state is shared between workers.
class SupportCounter {
public:
    struct Config {
        Config() = default;
        CountingStrategy strategy{CountingStrategy::TIDLIST_INTERSECTION};
        /// Worker threads for TRANSACTION_SCAN (1 = count on the calling thread).
        /// Capped at MaxWorkerThreads().
        size_t num_threads{1};
    };

    /// Upper bound on scan workers: hardware concurrency, never below kMinWorkerCap
    static size_t MaxWorkerThreads();
    static constexpr size_t kMinWorkerCap = 4;

    SupportCounter();
    explicit SupportCounter(const Config& config);

    /// Count support of every candidate
    /// @param store Transaction database
    /// @param candidates Normalized itemsets of equal size
    /// @return counts[i] = support count of candidates[i]
    std::vector<uint32_t> Count(const TransactionStore& store,
                                const std::vector<Itemset>& candidates) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::vector<uint32_t> CountByTidLists(const TransactionStore& store,
                                          const std::vector<Itemset>& candidates) const;

    std::vector<uint32_t> CountByScan(const TransactionStore& store,
                                      const std::vector<Itemset>& candidates) const;
};

} // namespace arminer
