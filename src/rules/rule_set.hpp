// File: src/rules/rule_set.hpp
#pragma once

#include "rules/association_rule.hpp"
#include <functional>
#include <ostream>
#include <utility>
#include <string>
#include <vector>

namespace arminer {

/// Quality measure used to rank rules
enum class SortKey : uint8_t {
    SUPPORT = 0,
    CONFIDENCE = 1,
    LIFT = 2,
};

// Convert SortKey to string ("support", "confidence", "lift")
const char* ToString(SortKey key);

// Parse SortKey from string
// @throws InvalidParameterError for an unknown key
SortKey ParseSortKey(const std::string& str);

/// RuleSet: Ordered, immutable sequence of association rules
///
/// Every transformation returns a new RuleSet and leaves the source untouched.
/// Sorting is stable and descending, so rules with equal measure keep their
/// generation order.
class RuleSet {
public:
    using const_iterator = std::vector<AssociationRule>::const_iterator;
    using Predicate = std::function<bool(const AssociationRule&)>;

    RuleSet() = default;
    explicit RuleSet(std::vector<AssociationRule> rules) : rules_(std::move(rules)) {}

    size_t Size() const { return rules_.size(); }
    bool IsEmpty() const { return rules_.empty(); }

    const AssociationRule& operator[](size_t index) const { return rules_[index]; }

    /// @throws std::out_of_range for an invalid index
    const AssociationRule& At(size_t index) const { return rules_.at(index); }

    const std::vector<AssociationRule>& Rules() const { return rules_; }

    const_iterator begin() const { return rules_.begin(); }
    const_iterator end() const { return rules_.end(); }

    // ========================================================================
    // Transformations
    // ========================================================================

    /// All rules, stable-sorted by `key` descending
    RuleSet SortBy(SortKey key) const;

    /// First `n` rules after SortBy(key); all rules if n >= Size()
    RuleSet TopN(size_t n, SortKey key) const;

    /// Rules satisfying the predicate, original order kept
    RuleSet Filter(const Predicate& predicate) const;

    /// Rules whose antecedent contains `item`
    RuleSet WithAntecedentItem(ItemID item) const;

    /// Rules whose consequent contains `item`
    RuleSet WithConsequentItem(ItemID item) const;

    // ========================================================================
    // Output
    // ========================================================================

    /// CSV with header: rules,support,confidence,lift,count
    void WriteCsv(std::ostream& out, const ItemDictionary& dictionary) const;

    bool operator==(const RuleSet& other) const { return rules_ == other.rules_; }
    bool operator!=(const RuleSet& other) const { return rules_ != other.rules_; }

private:
    std::vector<AssociationRule> rules_;
};

// Measure value of a rule for a sort key
double MeasureOf(const AssociationRule& rule, SortKey key);

} // namespace arminer
