// File: src/storage/persistent_backend.cpp
#include "storage/persistent_backend.hpp"
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace arminer {

// ============================================================================
// Constructor and Destructor
// ============================================================================

PersistentBackend::PersistentBackend(const Config& config)
    : config_(config) {

    // Open SQLite database
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // Initialize database schema and settings
    InitializeDatabase();
}

PersistentBackend::~PersistentBackend() {
    if (db_) {
        // sqlite3_close_v2 defers the close until outstanding statements finish
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void PersistentBackend::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Never wait forever on a locked database
    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    // page_size and auto_vacuum only take effect before the first table exists
    ExecuteSQL("PRAGMA page_size=" + std::to_string(config_.page_size) + ";");
    if (config_.enable_auto_vacuum) {
        ExecuteSQL("PRAGMA auto_vacuum=INCREMENTAL;");
    }
    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }

    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");
    ExecuteSQL("PRAGMA foreign_keys=ON;");

    CreateTables();
}

void PersistentBackend::CreateTables() {
    std::string schema = R"(
        CREATE TABLE IF NOT EXISTS datasets (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            transaction_count INTEGER NOT NULL,
            item_count INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS items (
            dataset_id INTEGER NOT NULL REFERENCES datasets(id) ON DELETE CASCADE,
            item_id INTEGER NOT NULL,
            label TEXT NOT NULL,
            PRIMARY KEY (dataset_id, item_id)
        );
        CREATE TABLE IF NOT EXISTS transaction_items (
            dataset_id INTEGER NOT NULL REFERENCES datasets(id) ON DELETE CASCADE,
            tid INTEGER NOT NULL,
            item_id INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS rule_sets (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            dataset_id INTEGER NOT NULL REFERENCES datasets(id) ON DELETE CASCADE,
            name TEXT NOT NULL,
            min_support REAL NOT NULL,
            min_confidence REAL NOT NULL,
            UNIQUE (dataset_id, name)
        );
        CREATE TABLE IF NOT EXISTS rules (
            rule_set_id INTEGER NOT NULL REFERENCES rule_sets(id) ON DELETE CASCADE,
            position INTEGER NOT NULL,
            antecedent TEXT NOT NULL,
            consequent TEXT NOT NULL,
            support_count INTEGER NOT NULL,
            antecedent_count INTEGER NOT NULL,
            consequent_count INTEGER NOT NULL,
            PRIMARY KEY (rule_set_id, position)
        );
        CREATE INDEX IF NOT EXISTS idx_transaction_items
            ON transaction_items(dataset_id, tid);
    )";

    if (!ExecuteSQL(schema)) {
        throw std::runtime_error("Failed to create tables: " + std::string(sqlite3_errmsg(db_)));
    }
}

bool PersistentBackend::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Datasets
// ============================================================================

bool PersistentBackend::SaveDataset(const std::string& name, const TransactionStore& store) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!BeginTransaction()) {
        return false;
    }

    // Replace: cascades to items, transactions and rule sets
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM datasets WHERE name = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        RollbackTransaction();
        return false;
    }

    // Catalogue row
    const char* insert_dataset =
        "INSERT INTO datasets (name, transaction_count, item_count) VALUES (?, ?, ?);";
    if (sqlite3_prepare_v2(db_, insert_dataset, -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(store.TransactionCount()));
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(store.ItemCount()));
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        RollbackTransaction();
        return false;
    }
    sqlite3_int64 dataset_id = sqlite3_last_insert_rowid(db_);

    // Dictionary
    if (sqlite3_prepare_v2(db_, "INSERT INTO items (dataset_id, item_id, label) VALUES (?, ?, ?);",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }
    const auto& labels = store.Dictionary().Labels();
    for (size_t i = 0; i < labels.size(); ++i) {
        sqlite3_bind_int64(stmt, 1, dataset_id);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(i));
        sqlite3_bind_text(stmt, 3, labels[i].c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            RollbackTransaction();
            return false;
        }
        sqlite3_reset(stmt);
    }
    sqlite3_finalize(stmt);

    // Transactions
    if (sqlite3_prepare_v2(db_, "INSERT INTO transaction_items (dataset_id, tid, item_id) VALUES (?, ?, ?);",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }
    const auto& transactions = store.Transactions();
    for (size_t tid = 0; tid < transactions.size(); ++tid) {
        for (const auto& item : transactions[tid]) {
            sqlite3_bind_int64(stmt, 1, dataset_id);
            sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(tid));
            sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(item.value()));
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                sqlite3_finalize(stmt);
                RollbackTransaction();
                return false;
            }
            sqlite3_reset(stmt);
        }
    }
    sqlite3_finalize(stmt);

    if (!CommitTransaction()) {
        return false;
    }
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<TransactionStore> PersistentBackend::LoadDataset(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_reads_.fetch_add(1, std::memory_order_relaxed);

    sqlite3_stmt* stmt;
    const char* find_sql = "SELECT id, transaction_count FROM datasets WHERE name = ?;";
    if (sqlite3_prepare_v2(db_, find_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    sqlite3_int64 dataset_id = sqlite3_column_int64(stmt, 0);
    size_t transaction_count = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
    sqlite3_finalize(stmt);

    // Dictionary, in ID order
    std::vector<std::string> labels;
    const char* items_sql = "SELECT label FROM items WHERE dataset_id = ? ORDER BY item_id;";
    if (sqlite3_prepare_v2(db_, items_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, dataset_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        labels.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);

    // Transactions; empty ones have no rows but are covered by transaction_count
    std::vector<Itemset> transactions(transaction_count);
    const char* tx_sql = "SELECT tid, item_id FROM transaction_items WHERE dataset_id = ? ORDER BY tid;";
    if (sqlite3_prepare_v2(db_, tx_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, dataset_id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        size_t tid = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        auto item = static_cast<ItemID::ValueType>(sqlite3_column_int64(stmt, 1));
        if (tid < transactions.size()) {
            transactions[tid].push_back(ItemID(item));
        }
    }
    sqlite3_finalize(stmt);

    return TransactionStore(ItemDictionary::FromLabels(labels), std::move(transactions));
}

bool PersistentBackend::DeleteDataset(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM datasets WHERE name = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

bool PersistentBackend::HasDataset(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindDatasetId(name).has_value();
}

std::vector<DatasetInfo> PersistentBackend::ListDatasets() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DatasetInfo> results;

    const char* sql = "SELECT id, name, transaction_count, item_count FROM datasets ORDER BY name;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DatasetInfo info;
        info.id = sqlite3_column_int64(stmt, 0);
        info.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        info.transaction_count = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
        info.item_count = static_cast<size_t>(sqlite3_column_int64(stmt, 3));
        results.push_back(std::move(info));
    }

    sqlite3_finalize(stmt);
    return results;
}

// ============================================================================
// Rule sets
// ============================================================================

bool PersistentBackend::SaveRuleSet(const std::string& dataset_name,
                                    const std::string& name,
                                    const RuleSet& rules,
                                    const RuleSetParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto dataset_id = FindDatasetId(dataset_name);
    if (!dataset_id) {
        return false;
    }

    if (!BeginTransaction()) {
        return false;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM rule_sets WHERE dataset_id = ? AND name = ?;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }
    sqlite3_bind_int64(stmt, 1, *dataset_id);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        RollbackTransaction();
        return false;
    }

    const char* insert_set =
        "INSERT INTO rule_sets (dataset_id, name, min_support, min_confidence) VALUES (?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, insert_set, -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }
    sqlite3_bind_int64(stmt, 1, *dataset_id);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, params.min_support);
    sqlite3_bind_double(stmt, 4, params.min_confidence);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        RollbackTransaction();
        return false;
    }
    sqlite3_int64 rule_set_id = sqlite3_last_insert_rowid(db_);

    const char* insert_rule =
        "INSERT INTO rules (rule_set_id, position, antecedent, consequent, "
        "support_count, antecedent_count, consequent_count) VALUES (?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, insert_rule, -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }

    for (size_t i = 0; i < rules.Size(); ++i) {
        const AssociationRule& rule = rules[i];
        std::string antecedent = EncodeItemset(rule.Antecedent());
        std::string consequent = EncodeItemset(rule.Consequent());

        sqlite3_bind_int64(stmt, 1, rule_set_id);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(i));
        sqlite3_bind_text(stmt, 3, antecedent.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, consequent.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, rule.SupportCount());
        sqlite3_bind_int64(stmt, 6, rule.AntecedentCount());
        sqlite3_bind_int64(stmt, 7, rule.ConsequentCount());

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            RollbackTransaction();
            return false;
        }
        sqlite3_reset(stmt);
    }
    sqlite3_finalize(stmt);

    if (!CommitTransaction()) {
        return false;
    }
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<RuleSet> PersistentBackend::LoadRuleSet(const std::string& dataset_name,
                                                      const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_reads_.fetch_add(1, std::memory_order_relaxed);

    const char* find_sql =
        "SELECT rs.id, d.transaction_count FROM rule_sets rs "
        "JOIN datasets d ON d.id = rs.dataset_id WHERE d.name = ? AND rs.name = ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, find_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, dataset_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    sqlite3_int64 rule_set_id = sqlite3_column_int64(stmt, 0);
    auto transaction_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 1));
    sqlite3_finalize(stmt);

    const char* rules_sql =
        "SELECT antecedent, consequent, support_count, antecedent_count, consequent_count "
        "FROM rules WHERE rule_set_id = ? ORDER BY position;";
    if (sqlite3_prepare_v2(db_, rules_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, rule_set_id);

    std::vector<AssociationRule> rules;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string antecedent = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        std::string consequent = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        rules.emplace_back(DecodeItemset(antecedent),
                           DecodeItemset(consequent),
                           static_cast<uint32_t>(sqlite3_column_int64(stmt, 2)),
                           static_cast<uint32_t>(sqlite3_column_int64(stmt, 3)),
                           static_cast<uint32_t>(sqlite3_column_int64(stmt, 4)),
                           transaction_count);
    }
    sqlite3_finalize(stmt);

    return RuleSet(std::move(rules));
}

std::optional<RuleSetParams> PersistentBackend::GetRuleSetParams(const std::string& dataset_name,
                                                                 const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT rs.min_support, rs.min_confidence FROM rule_sets rs "
        "JOIN datasets d ON d.id = rs.dataset_id WHERE d.name = ? AND rs.name = ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, dataset_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<RuleSetParams> params;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        RuleSetParams found;
        found.min_support = sqlite3_column_double(stmt, 0);
        found.min_confidence = sqlite3_column_double(stmt, 1);
        params = found;
    }

    sqlite3_finalize(stmt);
    return params;
}

std::vector<std::string> PersistentBackend::ListRuleSets(const std::string& dataset_name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;

    const char* sql =
        "SELECT rs.name FROM rule_sets rs JOIN datasets d ON d.id = rs.dataset_id "
        "WHERE d.name = ? ORDER BY rs.name;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return names;
    }
    sqlite3_bind_text(stmt, 1, dataset_name.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        names.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }

    sqlite3_finalize(stmt);
    return names;
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

StorageStats PersistentBackend::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StorageStats stats;
    stats.total_datasets = CountRows("datasets");
    stats.total_rule_sets = CountRows("rule_sets");
    stats.total_rules = CountRows("rules");
    stats.disk_usage_bytes = GetDatabaseSize();
    return stats;
}

void PersistentBackend::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }
}

void PersistentBackend::Compact() {
    std::lock_guard<std::mutex> lock(mutex_);

    ExecuteSQL("VACUUM;");

    if (config_.enable_auto_vacuum) {
        ExecuteSQL("PRAGMA incremental_vacuum;");
    }
}

void PersistentBackend::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Cascades to every other table
    ExecuteSQL("DELETE FROM datasets;");

    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Helper Methods
// ============================================================================

std::optional<int64_t> PersistentBackend::FindDatasetId(const std::string& name) const {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT id FROM datasets WHERE name = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<int64_t> id;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = sqlite3_column_int64(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return id;
}

size_t PersistentBackend::CountRows(const char* table) const {
    std::string sql = std::string("SELECT COUNT(*) FROM ") + table + ";";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

std::string PersistentBackend::EncodeItemset(const Itemset& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << items[i].value();
    }
    return oss.str();
}

Itemset PersistentBackend::DecodeItemset(const std::string& text) {
    Itemset items;
    std::istringstream iss(text);
    ItemID::ValueType value;
    while (iss >> value) {
        items.push_back(ItemID(value));
    }
    return items;
}

size_t PersistentBackend::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

bool PersistentBackend::BeginTransaction() {
    return ExecuteSQL("BEGIN TRANSACTION;");
}

bool PersistentBackend::CommitTransaction() {
    if (ExecuteSQL("COMMIT;")) {
        return true;
    }
    RollbackTransaction();
    return false;
}

void PersistentBackend::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

} // namespace arminer
