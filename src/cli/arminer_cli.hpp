// File: src/cli/arminer_cli.hpp
//
// ARMiner CLI class definition
// Extracted for testability

#ifndef ARMINER_CLI_HPP
#define ARMINER_CLI_HPP

#include "cli/cli_config.hpp"
#include "core/rule_mining_engine.hpp"
#include "storage/transaction_store.hpp"
#include "core/types.hpp"
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace arminer {

/// ANSI color codes for terminal output
namespace Color {
    // Reset
    inline const char* RESET = "\033[0m";

    // Regular colors
    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";

    // Bold colors
    inline const char* BOLD_RED = "\033[1;31m";
    inline const char* BOLD_GREEN = "\033[1;32m";
    inline const char* BOLD_CYAN = "\033[1;36m";

    // Styles
    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Interactive CLI for loading transaction data, mining rules and exploring them
class ARMinerCli {
public:
    explicit ARMinerCli(const CliConfig& config = CliConfig::Default(),
                        std::ostream& out = std::cout,
                        std::ostream& err = std::cerr);

    /// Main run loop - interactive mode
    void Run();

    /// Load the configured dataset, mine, print the top rules
    /// @return process exit code
    int RunBatch();

    /// Process a single command (for testing)
    /// Errors are reported on the error stream; the CLI keeps running.
    void ProcessCommand(const std::string& input);

    /// Load a dataset file
    /// @throws std::runtime_error if unreadable, EmptyDatasetError if empty
    void LoadDataset(const std::string& path, const std::string& format);

    // Accessors for verification
    bool IsRunning() const { return running_; }
    bool HasDataset() const { return store_.has_value(); }
    bool HasResult() const { return result_.has_value(); }
    const TransactionStore* GetStore() const { return store_ ? &*store_ : nullptr; }
    const std::optional<MiningResult>& GetResult() const { return result_; }
    const CliConfig& GetConfig() const { return config_; }
    const std::string& GetDatasetName() const { return dataset_name_; }
    const std::optional<ItemSet>& GetLhsRestriction() const { return lhs_allowed_; }
    const std::optional<ItemSet>& GetRhsRestriction() const { return rhs_allowed_; }
    size_t GetCommandCount() const { return commands_processed_; }
    size_t GetErrorCount() const { return errors_reported_; }

    /// Rules currently shown: mined rules with the side restriction applied
    RuleSet VisibleRules() const;

private:
    CliConfig config_;
    std::ostream& out_;
    std::ostream& err_;

    bool running_ = true;
    bool colors_enabled_ = true;

    // Dataset and last mining run
    std::optional<TransactionStore> store_;
    std::string dataset_name_;
    std::optional<MiningResult> result_;
    std::optional<RuleMiningEngine::Statistics> last_stats_;

    // Side restriction applied to displayed rules
    std::optional<ItemSet> lhs_allowed_;
    std::optional<ItemSet> rhs_allowed_;

    size_t commands_processed_ = 0;
    size_t errors_reported_ = 0;

    void PrintWelcome();

    // Command handling
    void HandleCommand(const std::string& cmd);

    // Commands
    void ShowHelp();
    void ShowSummary();
    void ShowItems(size_t n);
    void SetOption(const std::string& key, const std::string& value);
    void Mine();
    void ShowItemsets(size_t n);
    void ShowRules(size_t n, SortKey key);
    void ShowRedundant(size_t n);
    void RestrictSide(bool antecedent, const std::string& item_list);
    void ShowAppearance();
    void ExportRules(const std::string& path);
    void SaveToDatabase(const std::string& db_path, const std::string& name);
    void OpenFromDatabase(const std::string& db_path, const std::string& name);
    void ShowStatistics();

    // Utilities
    const TransactionStore& RequireStore() const;
    const MiningResult& RequireResult() const;
    void PrintRules(const RuleSet& rules, size_t n);
    static std::vector<std::string> SplitItemList(const std::string& text);

    // Color helpers
    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace arminer

#endif // ARMINER_CLI_HPP
