// File: src/storage/basket_reader.hpp
#pragma once

#include "storage/transaction_store.hpp"
#include <istream>
#include <string>
#include <vector>

namespace arminer {

/// Text layout of a transaction file
enum class DatasetFormat : uint8_t {
    BASKET = 0,  // One transaction per line: "milk,bread,butter"
    SINGLE = 1,  // One item per line: "<transaction id><sep><item>"
};

// Convert DatasetFormat to string
const char* ToString(DatasetFormat format);

// Parse DatasetFormat from string ("basket" or "single")
DatasetFormat ParseDatasetFormat(const std::string& str);

/// BasketReader: Reads plain-text transaction files
///
/// Lines starting with '#' and blank lines are skipped. Items are trimmed of
/// surrounding whitespace; empty items are dropped. In SINGLE layout the
/// transactions are emitted in order of first appearance of their id.
class BasketReader {
public:
    struct Config {
        Config() = default;
        DatasetFormat format{DatasetFormat::BASKET};
        /// Field separator
        char separator{','};
        /// Skip the first non-comment line (column header)
        bool has_header{false};
    };

    BasketReader();
    explicit BasketReader(const Config& config);

    /// Parse transactions as label lists
    std::vector<std::vector<std::string>> Read(std::istream& in) const;

    /// Parse transactions from a file
    /// @throws std::runtime_error if the file cannot be opened
    std::vector<std::vector<std::string>> ReadFile(const std::string& path) const;

    /// Read and load into a TransactionStore
    /// @throws EmptyDatasetError if the file holds no transactions
    TransactionStore LoadFile(const std::string& path) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::vector<std::vector<std::string>> ReadBasket(std::istream& in) const;
    std::vector<std::vector<std::string>> ReadSingle(std::istream& in) const;

    std::vector<std::string> SplitFields(const std::string& line) const;
};

} // namespace arminer
