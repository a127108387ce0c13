// File: src/storage/transaction_store.cpp
#include "storage/transaction_store.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace arminer {

// ============================================================================
// Construction
// ============================================================================

TransactionStore TransactionStore::Load(const std::vector<std::vector<std::string>>& transactions) {
    if (transactions.empty()) {
        throw EmptyDatasetError("Transaction database must contain at least one transaction");
    }

    // Collect unique labels first so IDs follow label order
    std::vector<std::string> labels;
    for (const auto& transaction : transactions) {
        labels.insert(labels.end(), transaction.begin(), transaction.end());
    }
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());

    TransactionStore store;
    store.dictionary_ = ItemDictionary::FromLabels(labels);
    store.transactions_.reserve(transactions.size());

    for (const auto& transaction : transactions) {
        Itemset items;
        items.reserve(transaction.size());
        for (const auto& label : transaction) {
            items.push_back(*store.dictionary_.Find(label));
        }
        Normalize(items);
        store.transactions_.push_back(std::move(items));
    }

    store.BuildIndex();
    return store;
}

TransactionStore::TransactionStore(ItemDictionary dictionary, std::vector<Itemset> transactions)
    : dictionary_(std::move(dictionary)),
      transactions_(std::move(transactions))
{
    if (transactions_.empty()) {
        throw EmptyDatasetError("Transaction database must contain at least one transaction");
    }

    for (auto& transaction : transactions_) {
        Normalize(transaction);
        for (const auto& item : transaction) {
            if (!dictionary_.Has(item)) {
                throw InvalidParameterError("Transaction references unknown item " + item.ToString());
            }
        }
    }

    BuildIndex();
}

void TransactionStore::BuildIndex() {
    tid_lists_.assign(dictionary_.Size(), TidList());

    for (size_t tid = 0; tid < transactions_.size(); ++tid) {
        for (const auto& item : transactions_[tid]) {
            tid_lists_[item.value()].push_back(static_cast<TransactionIndex>(tid));
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

uint32_t TransactionStore::SupportCount(const Itemset& itemset) const {
    if (itemset.empty()) {
        return static_cast<uint32_t>(transactions_.size());
    }

    // Intersect starting from the shortest tid-list
    std::vector<const TidList*> lists;
    lists.reserve(itemset.size());
    for (const auto& item : itemset) {
        const TidList& list = GetTidList(item);
        if (list.empty()) {
            return 0;
        }
        lists.push_back(&list);
    }
    std::sort(lists.begin(), lists.end(),
              [](const TidList* a, const TidList* b) { return a->size() < b->size(); });

    if (lists.size() == 1) {
        return static_cast<uint32_t>(lists.front()->size());
    }

    TidList current = *lists.front();
    TidList next;
    for (size_t i = 1; i < lists.size() && !current.empty(); ++i) {
        next.clear();
        std::set_intersection(current.begin(), current.end(),
                              lists[i]->begin(), lists[i]->end(),
                              std::back_inserter(next));
        current.swap(next);
    }

    return static_cast<uint32_t>(current.size());
}

double TransactionStore::Support(const Itemset& itemset) const {
    return static_cast<double>(SupportCount(itemset)) / transactions_.size();
}

uint32_t TransactionStore::ItemSupportCount(ItemID item) const {
    return static_cast<uint32_t>(GetTidList(item).size());
}

bool TransactionStore::Contains(TransactionIndex tid, ItemID item) const {
    return arminer::Contains(Transaction(tid), item);
}

bool TransactionStore::ContainsAll(TransactionIndex tid, const Itemset& itemset) const {
    return IsSubset(itemset, Transaction(tid));
}

// ============================================================================
// Accessors
// ============================================================================

const Itemset& TransactionStore::Transaction(TransactionIndex tid) const {
    if (tid >= transactions_.size()) {
        throw std::out_of_range("Transaction index out of range: " + std::to_string(tid));
    }
    return transactions_[tid];
}

const TransactionStore::TidList& TransactionStore::GetTidList(ItemID item) const {
    static const TidList kEmpty;
    if (!item.IsValid() || item.value() >= tid_lists_.size()) {
        return kEmpty;
    }
    return tid_lists_[item.value()];
}

Itemset TransactionStore::Items() const {
    Itemset items;
    items.reserve(dictionary_.Size());
    for (ItemID::ValueType i = 0; i < dictionary_.Size(); ++i) {
        items.push_back(ItemID(i));
    }
    return items;
}

// ============================================================================
// Statistics
// ============================================================================

std::vector<ItemFrequency> TransactionStore::ItemFrequencies() const {
    std::vector<ItemFrequency> frequencies;
    frequencies.reserve(tid_lists_.size());

    for (size_t i = 0; i < tid_lists_.size(); ++i) {
        ItemFrequency freq;
        freq.item = ItemID(static_cast<ItemID::ValueType>(i));
        freq.count = static_cast<uint32_t>(tid_lists_[i].size());
        freq.support = static_cast<double>(freq.count) / transactions_.size();
        frequencies.push_back(freq);
    }

    std::stable_sort(frequencies.begin(), frequencies.end(),
                     [](const ItemFrequency& a, const ItemFrequency& b) {
                         return a.count > b.count;
                     });
    return frequencies;
}

DatasetSummary TransactionStore::Summarize() const {
    DatasetSummary summary;
    summary.transaction_count = transactions_.size();
    summary.item_count = dictionary_.Size();

    size_t total_items = 0;
    summary.min_transaction_length = transactions_.front().size();
    for (const auto& transaction : transactions_) {
        size_t length = transaction.size();
        total_items += length;
        summary.min_transaction_length = std::min(summary.min_transaction_length, length);
        summary.max_transaction_length = std::max(summary.max_transaction_length, length);
        summary.length_distribution[length]++;
    }

    summary.mean_transaction_length = static_cast<double>(total_items) / transactions_.size();
    if (summary.item_count > 0) {
        summary.density = static_cast<double>(total_items) /
                          (static_cast<double>(summary.transaction_count) * summary.item_count);
    }

    return summary;
}

} // namespace arminer
