// File: src/rules/appearance.cpp
#include "rules/appearance.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace arminer {

const char* ToString(Side side) {
    switch (side) {
        case Side::LHS: return "lhs";
        case Side::RHS: return "rhs";
        case Side::BOTH: return "both";
        case Side::NONE: return "none";
        default: return "unknown";
    }
}

Side ParseSide(const std::string& str) {
    if (str == "lhs") return Side::LHS;
    if (str == "rhs") return Side::RHS;
    if (str == "both") return Side::BOTH;
    if (str == "none") return Side::NONE;
    throw InvalidParameterError("Unknown appearance side: " + str);
}

// ============================================================================
// Construction
// ============================================================================

Appearance Appearance::ForConsequents(const ItemSet& items) {
    Appearance appearance;
    appearance.default_side = Side::LHS;
    appearance.rhs = items;
    return appearance;
}

Appearance Appearance::ForAntecedents(const ItemSet& items) {
    Appearance appearance;
    appearance.default_side = Side::RHS;
    appearance.lhs = items;
    return appearance;
}

Appearance Appearance::FromLabels(const ItemDictionary& dictionary,
                                  Side default_side,
                                  const std::vector<std::string>& lhs_labels,
                                  const std::vector<std::string>& rhs_labels,
                                  const std::vector<std::string>& both_labels,
                                  const std::vector<std::string>& none_labels) {
    Appearance appearance;
    appearance.default_side = default_side;
    appearance.lhs = dictionary.Resolve(lhs_labels);
    appearance.rhs = dictionary.Resolve(rhs_labels);
    appearance.both = dictionary.Resolve(both_labels);
    appearance.none = dictionary.Resolve(none_labels);
    appearance.Validate();
    return appearance;
}

void Appearance::Validate() const {
    const ItemSet* lists[] = {&lhs, &rhs, &both, &none};
    const Side sides[] = {Side::LHS, Side::RHS, Side::BOTH, Side::NONE};

    for (size_t i = 0; i < 4; ++i) {
        for (size_t j = i + 1; j < 4; ++j) {
            for (const auto& item : *lists[i]) {
                if (lists[j]->count(item) > 0) {
                    throw InvalidParameterError(
                        "Item " + item.ToString() + " listed as both '" +
                        ToString(sides[i]) + "' and '" + ToString(sides[j]) + "'");
                }
            }
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

Side Appearance::SideOf(ItemID item) const {
    if (lhs.count(item) > 0) return Side::LHS;
    if (rhs.count(item) > 0) return Side::RHS;
    if (both.count(item) > 0) return Side::BOTH;
    if (none.count(item) > 0) return Side::NONE;
    return default_side;
}

bool Appearance::AllowsInAntecedent(ItemID item) const {
    Side side = SideOf(item);
    return side == Side::LHS || side == Side::BOTH;
}

bool Appearance::AllowsInConsequent(ItemID item) const {
    Side side = SideOf(item);
    return side == Side::RHS || side == Side::BOTH;
}

bool Appearance::AllowsAntecedent(const Itemset& items) const {
    return std::all_of(items.begin(), items.end(),
                       [this](ItemID item) { return AllowsInAntecedent(item); });
}

bool Appearance::AllowsConsequent(const Itemset& items) const {
    return std::all_of(items.begin(), items.end(),
                       [this](ItemID item) { return AllowsInConsequent(item); });
}

bool Appearance::Allows(const AssociationRule& rule) const {
    return AllowsAntecedent(rule.Antecedent()) && AllowsConsequent(rule.Consequent());
}

bool Appearance::IsUnrestricted() const {
    return default_side == Side::BOTH && lhs.empty() && rhs.empty() && none.empty();
}

// ============================================================================
// Post-filters
// ============================================================================

RuleSet RestrictAppearance(const RuleSet& rules,
                           const std::optional<ItemSet>& lhs_allowed,
                           const std::optional<ItemSet>& rhs_allowed) {
    auto all_in = [](const Itemset& items, const ItemSet& allowed) {
        return std::all_of(items.begin(), items.end(),
                           [&allowed](ItemID item) { return allowed.count(item) > 0; });
    };

    return rules.Filter([&](const AssociationRule& rule) {
        if (lhs_allowed && !all_in(rule.Antecedent(), *lhs_allowed)) {
            return false;
        }
        if (rhs_allowed && !all_in(rule.Consequent(), *rhs_allowed)) {
            return false;
        }
        return true;
    });
}

RuleSet RestrictAppearance(const RuleSet& rules, const Appearance& appearance) {
    appearance.Validate();
    if (appearance.IsUnrestricted()) {
        return rules;
    }
    return rules.Filter([&appearance](const AssociationRule& rule) {
        return appearance.Allows(rule);
    });
}

} // namespace arminer
