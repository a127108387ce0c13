// File: src/rules/rule_set.cpp
#include "rules/rule_set.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstddef>
#include <iomanip>

namespace arminer {

const char* ToString(SortKey key) {
    switch (key) {
        case SortKey::SUPPORT: return "support";
        case SortKey::CONFIDENCE: return "confidence";
        case SortKey::LIFT: return "lift";
        default: return "unknown";
    }
}

SortKey ParseSortKey(const std::string& str) {
    if (str == "support") return SortKey::SUPPORT;
    if (str == "confidence") return SortKey::CONFIDENCE;
    if (str == "lift") return SortKey::LIFT;
    throw InvalidParameterError("Unknown sort key: " + str);
}

double MeasureOf(const AssociationRule& rule, SortKey key) {
    switch (key) {
        case SortKey::SUPPORT: return rule.Support();
        case SortKey::CONFIDENCE: return rule.Confidence();
        case SortKey::LIFT: return rule.Lift();
        default: return 0.0;
    }
}

// ============================================================================
// Transformations
// ============================================================================

RuleSet RuleSet::SortBy(SortKey key) const {
    std::vector<AssociationRule> sorted = rules_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [key](const AssociationRule& a, const AssociationRule& b) {
                         return MeasureOf(a, key) > MeasureOf(b, key);
                     });
    return RuleSet(std::move(sorted));
}

RuleSet RuleSet::TopN(size_t n, SortKey key) const {
    std::vector<AssociationRule> sorted = SortBy(key).rules_;
    if (sorted.size() > n) {
        sorted.erase(sorted.begin() + static_cast<std::ptrdiff_t>(n), sorted.end());
    }
    return RuleSet(std::move(sorted));
}

RuleSet RuleSet::Filter(const Predicate& predicate) const {
    std::vector<AssociationRule> kept;
    for (const auto& rule : rules_) {
        if (predicate(rule)) {
            kept.push_back(rule);
        }
    }
    return RuleSet(std::move(kept));
}

RuleSet RuleSet::WithAntecedentItem(ItemID item) const {
    return Filter([item](const AssociationRule& rule) {
        return Contains(rule.Antecedent(), item);
    });
}

RuleSet RuleSet::WithConsequentItem(ItemID item) const {
    return Filter([item](const AssociationRule& rule) {
        return Contains(rule.Consequent(), item);
    });
}

// ============================================================================
// Output
// ============================================================================

void RuleSet::WriteCsv(std::ostream& out, const ItemDictionary& dictionary) const {
    out << "rules,support,confidence,lift,count\n";

    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    out << std::setprecision(6);

    for (const auto& rule : rules_) {
        // Quote the rule text; item labels may contain the separator
        std::string text = rule.ToString(dictionary);
        std::string quoted;
        quoted.reserve(text.size() + 2);
        quoted += '"';
        for (char c : text) {
            if (c == '"') {
                quoted += '"';
            }
            quoted += c;
        }
        quoted += '"';

        out << quoted << ','
            << rule.Support() << ','
            << rule.Confidence() << ','
            << rule.Lift() << ','
            << rule.SupportCount() << '\n';
    }

    out.flags(flags);
    out.precision(precision);
}

} // namespace arminer
