// File: src/storage/persistent_backend.hpp
#pragma once

#include "rules/rule_set.hpp"
#include "storage/transaction_store.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace arminer {

/// Storage statistics for monitoring the database
struct StorageStats {
    size_t total_datasets{0};
    size_t total_rule_sets{0};
    size_t total_rules{0};

    /// Total disk usage in bytes
    size_t disk_usage_bytes{0};
};

/// Catalogue entry of a stored dataset
struct DatasetInfo {
    int64_t id{0};
    std::string name;
    size_t transaction_count{0};
    size_t item_count{0};
};

/// Thresholds a stored rule set was mined with
struct RuleSetParams {
    double min_support{0.0};
    double min_confidence{0.0};
};

/// Persistent storage of transaction datasets and mined rule sets using SQLite
///
/// A dataset is stored with its item dictionary, so a reloaded store keeps
/// the exact ItemIDs and rule sets saved against it stay valid. Rule sets
/// belong to a dataset and are deleted with it.
///
/// Features:
/// - Durable writes with WAL (Write-Ahead Logging)
/// - Each save runs in one transaction and rolls back on failure
/// - Compaction via VACUUM
///
/// Thread-safety: All public methods are serialized by an internal mutex.
class PersistentBackend {
public:
    /// Configuration for PersistentBackend
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Cache size in KB (default: 10MB)
        size_t cache_size_kb{10240};

        /// Page size in bytes (default: 4KB)
        size_t page_size{4096};

        /// Enable auto-vacuum for space reclamation
        bool enable_auto_vacuum{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// How long a statement waits on a locked database before failing
        int busy_timeout_ms{5000};
    };

    /// Construct PersistentBackend with configuration
    /// @param config Configuration options
    /// @throws std::runtime_error if database cannot be opened or initialized
    explicit PersistentBackend(const Config& config);

    /// Destructor - closes database connection
    ~PersistentBackend();

    // Prevent copying (SQLite connection is not copyable)
    PersistentBackend(const PersistentBackend&) = delete;
    PersistentBackend& operator=(const PersistentBackend&) = delete;

    // ========================================================================
    // Datasets
    // ========================================================================

    /// Store a dataset under `name`, replacing any dataset of that name
    /// (and its rule sets)
    /// @return true if stored successfully
    bool SaveDataset(const std::string& name, const TransactionStore& store);

    /// Load a dataset by name
    /// @return The store if found, std::nullopt otherwise
    std::optional<TransactionStore> LoadDataset(const std::string& name);

    /// Delete a dataset and its rule sets
    /// @return true if a dataset was deleted
    bool DeleteDataset(const std::string& name);

    /// Check if a dataset exists
    bool HasDataset(const std::string& name) const;

    /// All stored datasets ordered by name
    std::vector<DatasetInfo> ListDatasets() const;

    // ========================================================================
    // Rule sets
    // ========================================================================

    /// Store a rule set mined from dataset `dataset_name`, replacing any rule
    /// set of the same name
    /// @return false if the dataset does not exist or the write failed
    bool SaveRuleSet(const std::string& dataset_name,
                     const std::string& name,
                     const RuleSet& rules,
                     const RuleSetParams& params);

    /// Load a rule set
    /// @return The rules in saved order, std::nullopt if not found
    std::optional<RuleSet> LoadRuleSet(const std::string& dataset_name,
                                       const std::string& name);

    /// Thresholds recorded with a rule set
    std::optional<RuleSetParams> GetRuleSetParams(const std::string& dataset_name,
                                                  const std::string& name) const;

    /// Names of the rule sets stored for a dataset, ordered by name
    std::vector<std::string> ListRuleSets(const std::string& dataset_name) const;

    // ========================================================================
    // Statistics and Maintenance
    // ========================================================================

    StorageStats GetStats() const;

    /// Checkpoint the WAL into the main database file
    void Flush();

    /// Reclaim space
    void Compact();

    /// Remove every dataset and rule set
    void Clear();

private:
    // Configuration
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    // Mutex for thread safety
    mutable std::mutex mutex_;

    // Statistics
    mutable std::atomic<uint64_t> total_reads_{0};
    mutable std::atomic<uint64_t> total_writes_{0};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Initialize database schema and pragmas
    void InitializeDatabase();

    /// Create tables and indices
    void CreateTables();

    /// Execute a SQL statement
    /// @return true if successful, false otherwise
    bool ExecuteSQL(const std::string& sql) const;

    /// Dataset row id, or std::nullopt (mutex must be held)
    std::optional<int64_t> FindDatasetId(const std::string& name) const;

    /// Count rows of a table (mutex must be held)
    size_t CountRows(const char* table) const;

    /// "3 5 9"
    static std::string EncodeItemset(const Itemset& items);

    /// Parse EncodeItemset output
    static Itemset DecodeItemset(const std::string& text);

    /// Get database file size in bytes
    size_t GetDatabaseSize() const;

    bool BeginTransaction();
    /// Rolls back when COMMIT fails, so no transaction is left open
    bool CommitTransaction();
    void RollbackTransaction();
};

} // namespace arminer
