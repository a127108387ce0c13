// File: src/rules/association_rule.hpp
#pragma once

#include "core/item_dictionary.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace arminer {

/// AssociationRule: Directional rule antecedent => consequent
///
/// A rule keeps the integer support counts it was derived from; support,
/// confidence and lift are computed from them on access:
///
///   support    = count(A u C) / N
///   confidence = count(A u C) / count(A)
///   lift       = confidence / (count(C) / N)
///
/// Rules are immutable values.
class AssociationRule {
public:
    /// @param antecedent Non-empty normalized itemset A
    /// @param consequent Non-empty normalized itemset C, disjoint from A
    /// @param support_count Transactions containing A u C
    /// @param antecedent_count Transactions containing A (> 0)
    /// @param consequent_count Transactions containing C
    /// @param transaction_count Transactions in the database
    /// @throws InvalidParameterError if the rule is not well-formed
    AssociationRule(Itemset antecedent,
                    Itemset consequent,
                    uint32_t support_count,
                    uint32_t antecedent_count,
                    uint32_t consequent_count,
                    uint32_t transaction_count);

    // ========================================================================
    // Accessors
    // ========================================================================

    const Itemset& Antecedent() const { return antecedent_; }
    const Itemset& Consequent() const { return consequent_; }

    /// A u C
    Itemset Items() const { return Union(antecedent_, consequent_); }

    /// Number of items on both sides
    size_t Size() const { return antecedent_.size() + consequent_.size(); }

    uint32_t SupportCount() const { return support_count_; }
    uint32_t AntecedentCount() const { return antecedent_count_; }
    uint32_t ConsequentCount() const { return consequent_count_; }
    uint32_t TransactionCount() const { return transaction_count_; }

    // ========================================================================
    // Quality measures
    // ========================================================================

    double Support() const;
    double Confidence() const;
    double Lift() const;

    /// Exact comparison of confidences without floating point:
    /// true if Confidence() >= other.Confidence()
    bool HasConfidenceAtLeast(const AssociationRule& other) const;

    /// "{bread} => {milk}"
    std::string ToString(const ItemDictionary& dictionary) const;

    /// Numeric form "{1} => {3}" for debugging
    std::string ToString() const;

    bool operator==(const AssociationRule& other) const;
    bool operator!=(const AssociationRule& other) const { return !(*this == other); }

private:
    Itemset antecedent_;
    Itemset consequent_;
    uint32_t support_count_;
    uint32_t antecedent_count_;
    uint32_t consequent_count_;
    uint32_t transaction_count_;
};

} // namespace arminer
