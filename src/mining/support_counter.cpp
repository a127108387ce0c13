// File: src/mining/support_counter.cpp
#include "mining/support_counter.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <functional>
#include <thread>

namespace arminer {

const char* ToString(CountingStrategy strategy) {
    switch (strategy) {
        case CountingStrategy::TIDLIST_INTERSECTION: return "tidlist";
        case CountingStrategy::TRANSACTION_SCAN: return "scan";
        default: return "unknown";
    }
}

CountingStrategy ParseCountingStrategy(const std::string& str) {
    if (str == "tidlist") return CountingStrategy::TIDLIST_INTERSECTION;
    if (str == "scan") return CountingStrategy::TRANSACTION_SCAN;
    throw InvalidParameterError("Unknown counting strategy: " + str);
}

// ============================================================================
// Construction
// ============================================================================

SupportCounter::SupportCounter()
    : SupportCounter(Config())
{
}

SupportCounter::SupportCounter(const Config& config)
    : config_(config)
{
    if (config_.num_threads == 0) {
        throw InvalidParameterError("num_threads must be at least 1");
    }
}

size_t SupportCounter::MaxWorkerThreads() {
    size_t hardware = std::thread::hardware_concurrency();
    return std::max(kMinWorkerCap, hardware);
}

// ============================================================================
// Counting
// ============================================================================

std::vector<uint32_t> SupportCounter::Count(const TransactionStore& store,
                                            const std::vector<Itemset>& candidates) const {
    if (candidates.empty()) {
        return {};
    }

    if (config_.strategy == CountingStrategy::TRANSACTION_SCAN) {
        return CountByScan(store, candidates);
    }
    return CountByTidLists(store, candidates);
}

std::vector<uint32_t> SupportCounter::CountByTidLists(
    const TransactionStore& store,
    const std::vector<Itemset>& candidates
) const {
    std::vector<uint32_t> counts;
    counts.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        counts.push_back(store.SupportCount(candidate));
    }
    return counts;
}

std::vector<uint32_t> SupportCounter::CountByScan(
    const TransactionStore& store,
    const std::vector<Itemset>& candidates
) const {
    // Bucket candidates by their first item so a transaction only tests the
    // candidates that can start inside it
    std::vector<std::vector<size_t>> by_first_item(store.ItemCount());
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];
        if (candidate.empty() || !store.Dictionary().Has(candidate.front())) {
            continue;
        }
        by_first_item[candidate.front().value()].push_back(i);
    }

    const auto& transactions = store.Transactions();

    auto count_shard = [&](size_t begin, size_t end, std::vector<uint32_t>& local) {
        for (size_t tid = begin; tid < end; ++tid) {
            const Itemset& transaction = transactions[tid];
            for (const auto& item : transaction) {
                for (size_t idx : by_first_item[item.value()]) {
                    if (IsSubset(candidates[idx], transaction)) {
                        ++local[idx];
                    }
                }
            }
        }
    };

    size_t num_workers = std::min(
        {config_.num_threads, transactions.size(), MaxWorkerThreads()});
    if (num_workers <= 1) {
        std::vector<uint32_t> counts(candidates.size(), 0);
        count_shard(0, transactions.size(), counts);
        return counts;
    }

    std::vector<std::vector<uint32_t>> partials(
        num_workers, std::vector<uint32_t>(candidates.size(), 0));
    std::vector<std::thread> workers;
    workers.reserve(num_workers);

    size_t shard_size = (transactions.size() + num_workers - 1) / num_workers;
    try {
        for (size_t w = 0; w < num_workers; ++w) {
            size_t begin = w * shard_size;
            size_t end = std::min(begin + shard_size, transactions.size());
            workers.emplace_back(count_shard, begin, end, std::ref(partials[w]));
        }
    } catch (...) {
        // Workers already running still reference local state
        for (auto& worker : workers) {
            worker.join();
        }
        throw;
    }

    for (auto& worker : workers) {
        worker.join();
    }

    // Single-threaded reduction
    std::vector<uint32_t> counts(candidates.size(), 0);
    for (const auto& partial : partials) {
        for (size_t i = 0; i < counts.size(); ++i) {
            counts[i] += partial[i];
        }
    }
    return counts;
}

} // namespace arminer
