// File: src/rules/appearance.hpp
#pragma once

#include "core/item_dictionary.hpp"
#include "core/types.hpp"
#include "rules/rule_set.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arminer {

/// Rule side an item is allowed on
enum class Side : uint8_t {
    LHS = 0,   // Antecedent only
    RHS = 1,   // Consequent only
    BOTH = 2,  // Either side
    NONE = 3,  // Neither side (rules with this item are not generated)
};

// Convert Side to string ("lhs", "rhs", "both", "none")
const char* ToString(Side side);

// Parse Side from string
Side ParseSide(const std::string& str);

/// Appearance: Restriction on which items may occur on which side of a rule
///
/// Items listed in `lhs` may only appear in antecedents, items in `rhs` only
/// in consequents, items in `both` on either side and items in `none` on
/// neither. Unlisted items follow `default_side`. An item may be listed at
/// most once; Validate() rejects overlaps.
struct Appearance {
    Side default_side{Side::BOTH};
    ItemSet lhs;
    ItemSet rhs;
    ItemSet both;
    ItemSet none;

    /// Consequent restricted to `items`; every other item antecedent-only
    static Appearance ForConsequents(const ItemSet& items);

    /// Antecedent restricted to `items`; every other item consequent-only
    static Appearance ForAntecedents(const ItemSet& items);

    /// Resolve label lists against a dictionary, dropping unknown labels
    /// @throws InvalidParameterError if a known label appears in two lists
    static Appearance FromLabels(const ItemDictionary& dictionary,
                                 Side default_side,
                                 const std::vector<std::string>& lhs_labels,
                                 const std::vector<std::string>& rhs_labels,
                                 const std::vector<std::string>& both_labels = {},
                                 const std::vector<std::string>& none_labels = {});

    /// @throws InvalidParameterError if an item is listed more than once
    void Validate() const;

    /// Side the item is allowed on
    Side SideOf(ItemID item) const;

    bool AllowsInAntecedent(ItemID item) const;
    bool AllowsInConsequent(ItemID item) const;

    /// True if every item may appear in an antecedent
    bool AllowsAntecedent(const Itemset& items) const;

    /// True if every item may appear in a consequent
    bool AllowsConsequent(const Itemset& items) const;

    /// True if the rule satisfies the restriction
    bool Allows(const AssociationRule& rule) const;

    /// True if no restriction applies
    bool IsUnrestricted() const;
};

/// Keep rules whose antecedent items are all in `lhs_allowed` (when given)
/// and whose consequent items are all in `rhs_allowed` (when given).
/// An empty result is valid.
RuleSet RestrictAppearance(const RuleSet& rules,
                           const std::optional<ItemSet>& lhs_allowed,
                           const std::optional<ItemSet>& rhs_allowed);

/// Keep rules satisfying an Appearance
/// @throws InvalidParameterError if the appearance is inconsistent
RuleSet RestrictAppearance(const RuleSet& rules, const Appearance& appearance);

} // namespace arminer
