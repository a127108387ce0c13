// File: src/storage/transaction_store.hpp
#pragma once

#include "core/item_dictionary.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace arminer {

/// Summary statistics of a transaction database
struct DatasetSummary {
    size_t transaction_count{0};
    size_t item_count{0};

    /// Fraction of the transaction x item matrix that is filled
    double density{0.0};

    size_t min_transaction_length{0};
    size_t max_transaction_length{0};
    double mean_transaction_length{0.0};

    /// Transaction length -> number of transactions with that length
    std::map<size_t, size_t> length_distribution;
};

/// Relative support of a single item
struct ItemFrequency {
    ItemID item;
    uint32_t count{0};
    double support{0.0};
};

/// TransactionStore: Immutable transaction database with an inverted index
///
/// Transactions are stored as normalized itemsets. For every item the store
/// keeps the sorted list of transaction indices containing it (its tid-list),
/// so the support count of an itemset is the size of the intersection of its
/// items' tid-lists.
///
/// The store is built once and never mutated afterwards; any number of
/// threads may read it concurrently.
class TransactionStore {
public:
    using TransactionIndex = uint32_t;
    using TidList = std::vector<TransactionIndex>;

    /// Load transactions given as item labels
    ///
    /// Labels are interned in ascending lexicographic order so the ItemID
    /// order matches the label order. Duplicate labels within a transaction
    /// collapse. Empty transactions are kept and count towards the total.
    ///
    /// @throws EmptyDatasetError if there are no transactions
    static TransactionStore Load(const std::vector<std::vector<std::string>>& transactions);

    /// Construct from an existing dictionary and ID transactions
    /// @throws EmptyDatasetError if there are no transactions
    /// @throws InvalidParameterError if a transaction references an unknown item
    TransactionStore(ItemDictionary dictionary, std::vector<Itemset> transactions);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Number of transactions containing every item of the itemset
    /// The empty itemset is contained in every transaction.
    uint32_t SupportCount(const Itemset& itemset) const;

    /// SupportCount divided by the number of transactions
    double Support(const Itemset& itemset) const;

    /// Support count of a single item
    uint32_t ItemSupportCount(ItemID item) const;

    /// Membership test for one transaction
    bool Contains(TransactionIndex tid, ItemID item) const;

    /// Check whether a transaction contains a whole itemset
    bool ContainsAll(TransactionIndex tid, const Itemset& itemset) const;

    // ========================================================================
    // Accessors
    // ========================================================================

    size_t TransactionCount() const { return transactions_.size(); }
    size_t ItemCount() const { return dictionary_.Size(); }

    /// Transaction by index
    /// @throws std::out_of_range for an invalid index
    const Itemset& Transaction(TransactionIndex tid) const;

    const std::vector<Itemset>& Transactions() const { return transactions_; }

    /// Sorted transaction indices containing the item (empty for unknown items)
    const TidList& GetTidList(ItemID item) const;

    const ItemDictionary& Dictionary() const { return dictionary_; }

    /// All items, ascending
    Itemset Items() const;

    // ========================================================================
    // Statistics
    // ========================================================================

    /// Per-item relative support, sorted by support descending then item order
    std::vector<ItemFrequency> ItemFrequencies() const;

    /// Transaction count, item count, density and length distribution
    DatasetSummary Summarize() const;

private:
    TransactionStore() = default;

    /// Build the tid-lists from transactions_
    void BuildIndex();

    ItemDictionary dictionary_;
    std::vector<Itemset> transactions_;
    std::vector<TidList> tid_lists_;
};

} // namespace arminer
