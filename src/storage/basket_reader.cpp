// File: src/storage/basket_reader.cpp
#include "storage/basket_reader.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace arminer {

namespace {

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

bool IsSkippable(const std::string& trimmed) {
    return trimmed.empty() || trimmed[0] == '#';
}

} // namespace

const char* ToString(DatasetFormat format) {
    switch (format) {
        case DatasetFormat::BASKET: return "basket";
        case DatasetFormat::SINGLE: return "single";
        default: return "unknown";
    }
}

DatasetFormat ParseDatasetFormat(const std::string& str) {
    if (str == "basket") return DatasetFormat::BASKET;
    if (str == "single") return DatasetFormat::SINGLE;
    throw InvalidParameterError("Unknown dataset format: " + str);
}

// ============================================================================
// Construction
// ============================================================================

BasketReader::BasketReader()
    : BasketReader(Config())
{
}

BasketReader::BasketReader(const Config& config)
    : config_(config)
{
}

// ============================================================================
// Reading
// ============================================================================

std::vector<std::vector<std::string>> BasketReader::Read(std::istream& in) const {
    if (config_.format == DatasetFormat::SINGLE) {
        return ReadSingle(in);
    }
    return ReadBasket(in);
}

std::vector<std::vector<std::string>> BasketReader::ReadFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open dataset file: " + path);
    }
    return Read(file);
}

TransactionStore BasketReader::LoadFile(const std::string& path) const {
    return TransactionStore::Load(ReadFile(path));
}

std::vector<std::vector<std::string>> BasketReader::ReadBasket(std::istream& in) const {
    std::vector<std::vector<std::string>> transactions;
    std::string line;
    bool header_pending = config_.has_header;

    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (IsSkippable(trimmed)) {
            continue;
        }
        if (header_pending) {
            header_pending = false;
            continue;
        }

        auto items = SplitFields(trimmed);
        if (!items.empty()) {
            transactions.push_back(std::move(items));
        }
    }

    return transactions;
}

std::vector<std::vector<std::string>> BasketReader::ReadSingle(std::istream& in) const {
    std::vector<std::vector<std::string>> transactions;
    std::unordered_map<std::string, size_t> position;
    std::string line;
    bool header_pending = config_.has_header;

    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (IsSkippable(trimmed)) {
            continue;
        }
        if (header_pending) {
            header_pending = false;
            continue;
        }

        size_t sep = trimmed.find(config_.separator);
        if (sep == std::string::npos) {
            throw std::runtime_error("Malformed line (expected '<id>" +
                                     std::string(1, config_.separator) + "<item>'): " + trimmed);
        }

        std::string tid = Trim(trimmed.substr(0, sep));
        std::string item = Trim(trimmed.substr(sep + 1));
        if (item.empty()) {
            continue;
        }

        auto [it, inserted] = position.emplace(tid, transactions.size());
        if (inserted) {
            transactions.emplace_back();
        }
        transactions[it->second].push_back(item);
    }

    return transactions;
}

std::vector<std::string> BasketReader::SplitFields(const std::string& line) const {
    std::vector<std::string> fields;
    size_t start = 0;

    while (start <= line.size()) {
        size_t end = line.find(config_.separator, start);
        if (end == std::string::npos) {
            end = line.size();
        }

        std::string field = Trim(line.substr(start, end - start));
        if (!field.empty()) {
            fields.push_back(std::move(field));
        }
        start = end + 1;
    }

    return fields;
}

} // namespace arminer
