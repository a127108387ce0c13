// File: src/mining/frequent_itemset.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>

namespace arminer {

/// An itemset together with its support count
struct FrequentItemset {
    Itemset items;

    /// Number of transactions containing every item
    uint32_t support_count{0};

    /// Number of transactions in the database the count was taken on
    uint32_t transaction_count{0};

    double Support() const {
        return transaction_count == 0
            ? 0.0
            : static_cast<double>(support_count) / transaction_count;
    }

    size_t Size() const { return items.size(); }

    bool operator==(const FrequentItemset& other) const {
        return items == other.items &&
               support_count == other.support_count &&
               transaction_count == other.transaction_count;
    }
};

} // namespace arminer
