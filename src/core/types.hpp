// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <set>
#include <string>
#include <vector>

namespace arminer {

// ItemID: Identifier of an interned item (product, category code)
// Dense 32-bit index assigned by ItemDictionary
class ItemID {
public:
    // Type alias for underlying storage
    using ValueType = uint32_t;

    // Default constructor creates invalid ID
    ItemID() : value_(kInvalidID) {}

    // Explicit constructor from value
    explicit ItemID(ValueType value) : value_(value) {}

    // Check if ID is valid
    bool IsValid() const { return value_ != kInvalidID; }

    // Get underlying value
    ValueType value() const { return value_; }

    // Comparison operators (define the fixed total order on items)
    bool operator==(const ItemID& other) const { return value_ == other.value_; }
    bool operator!=(const ItemID& other) const { return value_ != other.value_; }
    bool operator<(const ItemID& other) const { return value_ < other.value_; }
    bool operator>(const ItemID& other) const { return value_ > other.value_; }
    bool operator<=(const ItemID& other) const { return value_ <= other.value_; }
    bool operator>=(const ItemID& other) const { return value_ >= other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const ItemID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = std::numeric_limits<ValueType>::max();

    ValueType value_;
};

// Itemset: sorted, duplicate-free sequence of items
// Sorted order makes subset tests and prefix joins linear merges
using Itemset = std::vector<ItemID>;

// ItemSet: unordered collection of items used for membership restrictions
using ItemSet = std::set<ItemID>;

// Sort and deduplicate in place
void Normalize(Itemset& items);

// Build a normalized itemset from arbitrary items
Itemset MakeItemset(std::vector<ItemID> items);

// Check sorted-order invariant (strictly increasing)
bool IsNormalized(const Itemset& items);

// True if every item of `subset` is in `superset` (both normalized)
bool IsSubset(const Itemset& subset, const Itemset& superset);

// True if `subset` is a subset of `superset` and smaller
bool IsStrictSubset(const Itemset& subset, const Itemset& superset);

// True if the two itemsets share no item
bool AreDisjoint(const Itemset& a, const Itemset& b);

// Set union of two normalized itemsets
Itemset Union(const Itemset& a, const Itemset& b);

// Items of `a` not in `b`
Itemset Difference(const Itemset& a, const Itemset& b);

// True if `item` is in the normalized itemset
bool Contains(const Itemset& items, ItemID item);

// Numeric representation "{0,4,7}" for debugging
std::string ToString(const Itemset& items);

// Hash for unordered containers keyed by itemset
struct ItemsetHash {
    size_t operator()(const Itemset& items) const;
};

} // namespace arminer

// Hash specialization for std::unordered_map
namespace std {
    template<>
    struct hash<arminer::ItemID> {
        size_t operator()(const arminer::ItemID& id) const {
            return arminer::ItemID::Hash()(id);
        }
    };
}
