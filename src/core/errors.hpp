// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace arminer {

/// Raised when a transaction database with zero transactions is loaded
class EmptyDatasetError : public std::invalid_argument {
public:
    explicit EmptyDatasetError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Raised when a threshold, length bound or rule shape is out of its valid range
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace arminer
