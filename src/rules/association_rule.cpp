// File: src/rules/association_rule.cpp
#include "rules/association_rule.hpp"
#include "core/errors.hpp"
#include <utility>

namespace arminer {

AssociationRule::AssociationRule(Itemset antecedent,
                                 Itemset consequent,
                                 uint32_t support_count,
                                 uint32_t antecedent_count,
                                 uint32_t consequent_count,
                                 uint32_t transaction_count)
    : antecedent_(std::move(antecedent)),
      consequent_(std::move(consequent)),
      support_count_(support_count),
      antecedent_count_(antecedent_count),
      consequent_count_(consequent_count),
      transaction_count_(transaction_count)
{
    if (antecedent_.empty() || consequent_.empty()) {
        throw InvalidParameterError("Rule sides must be non-empty");
    }
    if (!IsNormalized(antecedent_) || !IsNormalized(consequent_)) {
        throw InvalidParameterError("Rule sides must be sorted and duplicate-free");
    }
    if (!AreDisjoint(antecedent_, consequent_)) {
        throw InvalidParameterError("Antecedent and consequent must be disjoint: " +
                                    arminer::ToString(antecedent_) + " => " +
                                    arminer::ToString(consequent_));
    }
    if (antecedent_count_ == 0) {
        throw InvalidParameterError("Antecedent support must be positive");
    }
    if (support_count_ > antecedent_count_ || support_count_ > consequent_count_ ||
        antecedent_count_ > transaction_count_ || consequent_count_ > transaction_count_) {
        throw InvalidParameterError("Inconsistent support counts for rule " +
                                    arminer::ToString(antecedent_) + " => " +
                                    arminer::ToString(consequent_));
    }
}

double AssociationRule::Support() const {
    return static_cast<double>(support_count_) / transaction_count_;
}

double AssociationRule::Confidence() const {
    return static_cast<double>(support_count_) / antecedent_count_;
}

double AssociationRule::Lift() const {
    if (consequent_count_ == 0) {
        return 0.0;
    }
    return static_cast<double>(support_count_) * transaction_count_ /
           (static_cast<double>(antecedent_count_) * consequent_count_);
}

bool AssociationRule::HasConfidenceAtLeast(const AssociationRule& other) const {
    // s / a >= s' / a'  <=>  s * a' >= s' * a   (a, a' > 0)
    uint64_t lhs = static_cast<uint64_t>(support_count_) * other.antecedent_count_;
    uint64_t rhs = static_cast<uint64_t>(other.support_count_) * antecedent_count_;
    return lhs >= rhs;
}

std::string AssociationRule::ToString(const ItemDictionary& dictionary) const {
    return dictionary.Format(antecedent_) + " => " + dictionary.Format(consequent_);
}

std::string AssociationRule::ToString() const {
    return arminer::ToString(antecedent_) + " => " + arminer::ToString(consequent_);
}

bool AssociationRule::operator==(const AssociationRule& other) const {
    return antecedent_ == other.antecedent_ &&
           consequent_ == other.consequent_ &&
           support_count_ == other.support_count_ &&
           antecedent_count_ == other.antecedent_count_ &&
           consequent_count_ == other.consequent_count_ &&
           transaction_count_ == other.transaction_count_;
}

} // namespace arminer
