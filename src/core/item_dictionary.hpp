// File: src/core/item_dictionary.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arminer {

/// ItemDictionary: Bidirectional mapping between item labels and ItemIDs
///
/// IDs are dense and assigned in insertion order starting at 0, so an ID can
/// index per-item arrays directly. Labels are unique.
///
/// Thread-safety: Not thread-safe for writes. Concurrent reads are safe.
class ItemDictionary {
public:
    ItemDictionary() = default;

    /// Build a dictionary whose ID i maps to labels[i]
    /// @throws InvalidParameterError on duplicate or empty labels
    static ItemDictionary FromLabels(const std::vector<std::string>& labels);

    /// Return the ID for a label, assigning the next ID if it is new
    /// @throws InvalidParameterError if the label is empty
    ItemID Intern(const std::string& label);

    /// Look up a label without interning it
    std::optional<ItemID> Find(const std::string& label) const;

    /// Get the label of an item
    /// @throws std::out_of_range for an unknown ID
    const std::string& Label(ItemID id) const;

    /// Check whether the ID belongs to this dictionary
    bool Has(ItemID id) const { return id.IsValid() && id.value() < labels_.size(); }

    size_t Size() const { return labels_.size(); }
    bool IsEmpty() const { return labels_.empty(); }

    /// All labels, indexed by ID value
    const std::vector<std::string>& Labels() const { return labels_; }

    /// Resolve labels to IDs, silently dropping unknown labels
    ItemSet Resolve(const std::vector<std::string>& labels) const;

    /// Format an itemset as "{bread,milk}"
    std::string Format(const Itemset& items) const;

private:
    std::vector<std::string> labels_;
    std::unordered_map<std::string, ItemID> index_;
};

} // namespace arminer
