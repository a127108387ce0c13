// File: src/core/item_dictionary.cpp
#include "core/item_dictionary.hpp"
#include "core/errors.hpp"
#include <sstream>
#include <stdexcept>

namespace arminer {

ItemDictionary ItemDictionary::FromLabels(const std::vector<std::string>& labels) {
    ItemDictionary dictionary;
    dictionary.labels_.reserve(labels.size());
    for (const auto& label : labels) {
        if (dictionary.Find(label)) {
            throw InvalidParameterError("Duplicate item label: " + label);
        }
        dictionary.Intern(label);
    }
    return dictionary;
}

ItemID ItemDictionary::Intern(const std::string& label) {
    if (label.empty()) {
        throw InvalidParameterError("Item label must not be empty");
    }

    auto it = index_.find(label);
    if (it != index_.end()) {
        return it->second;
    }

    ItemID id(static_cast<ItemID::ValueType>(labels_.size()));
    labels_.push_back(label);
    index_.emplace(label, id);
    return id;
}

std::optional<ItemID> ItemDictionary::Find(const std::string& label) const {
    auto it = index_.find(label);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& ItemDictionary::Label(ItemID id) const {
    if (!Has(id)) {
        throw std::out_of_range("Unknown item: " + id.ToString());
    }
    return labels_[id.value()];
}

ItemSet ItemDictionary::Resolve(const std::vector<std::string>& labels) const {
    ItemSet result;
    for (const auto& label : labels) {
        if (auto id = Find(label)) {
            result.insert(*id);
        }
    }
    return result;
}

std::string ItemDictionary::Format(const Itemset& items) const {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << (Has(items[i]) ? labels_[items[i].value()] : items[i].ToString());
    }
    oss << "}";
    return oss.str();
}

} // namespace arminer
