// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>

namespace arminer {

std::string ItemID::ToString() const {
    if (!IsValid()) {
        return "ItemID(INVALID)";
    }
    std::ostringstream oss;
    oss << "ItemID(" << value_ << ")";
    return oss.str();
}

// ============================================================================
// Itemset algebra
// ============================================================================

void Normalize(Itemset& items) {
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());
}

Itemset MakeItemset(std::vector<ItemID> items) {
    Normalize(items);
    return items;
}

bool IsNormalized(const Itemset& items) {
    return std::adjacent_find(items.begin(), items.end(),
                              [](ItemID a, ItemID b) { return !(a < b); }) == items.end();
}

bool IsSubset(const Itemset& subset, const Itemset& superset) {
    if (subset.size() > superset.size()) {
        return false;
    }
    return std::includes(superset.begin(), superset.end(), subset.begin(), subset.end());
}

bool IsStrictSubset(const Itemset& subset, const Itemset& superset) {
    return subset.size() < superset.size() && IsSubset(subset, superset);
}

bool AreDisjoint(const Itemset& a, const Itemset& b) {
    auto it_a = a.begin();
    auto it_b = b.begin();
    while (it_a != a.end() && it_b != b.end()) {
        if (*it_a < *it_b) {
            ++it_a;
        } else if (*it_b < *it_a) {
            ++it_b;
        } else {
            return false;
        }
    }
    return true;
}

Itemset Union(const Itemset& a, const Itemset& b) {
    Itemset result;
    result.reserve(a.size() + b.size());
    std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result));
    return result;
}

Itemset Difference(const Itemset& a, const Itemset& b) {
    Itemset result;
    result.reserve(a.size());
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result));
    return result;
}

bool Contains(const Itemset& items, ItemID item) {
    return std::binary_search(items.begin(), items.end(), item);
}

std::string ToString(const Itemset& items) {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << items[i].value();
    }
    oss << "}";
    return oss.str();
}

size_t ItemsetHash::operator()(const Itemset& items) const {
    // FNV-1a over the item values
    size_t hash = 1469598103934665603ULL;
    for (const auto& item : items) {
        hash ^= static_cast<size_t>(item.value());
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace arminer
