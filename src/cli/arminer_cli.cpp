// File: src/cli/arminer_cli.cpp
//
// Interactive CLI for ARMiner
//
// Features:
// - Dataset loading (basket and single layouts)
// - Itemset and rule mining with adjustable thresholds
// - Rule exploration: ranking, side restriction, redundancy
// - CSV export and SQLite persistence

#include "cli/arminer_cli.hpp"
#include "rules/appearance.hpp"
#include "rules/redundancy_filter.hpp"
#include "storage/basket_reader.hpp"
#include "storage/persistent_backend.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace arminer {

namespace {

constexpr const char* kRuleSetName = "rules";

size_t ParseCount(const std::string& text) {
    try {
        size_t pos = 0;
        unsigned long value = std::stoul(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument(text);
        }
        return static_cast<size_t>(value);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Expected a count, got '" + text + "'");
    }
}

} // namespace

ARMinerCli::ARMinerCli(const CliConfig& config, std::ostream& out, std::ostream& err)
    : config_(config),
      out_(out),
      err_(err),
      colors_enabled_(config.interface.colors_enabled) {
}

// ============================================================================
// Run loops
// ============================================================================

void ARMinerCli::Run() {
    PrintWelcome();

    std::string line;
    while (running_) {
        out_ << C(Color::BOLD_CYAN) << config_.interface.prompt << C(Color::RESET);
        if (!std::getline(std::cin, line)) {
            break;
        }

        ProcessCommand(line);
    }

    out_ << "\nGoodbye.\n";
}

int ARMinerCli::RunBatch() {
    try {
        if (!store_) {
            if (config_.dataset.path.empty()) {
                err_ << "Batch mode needs a dataset (--data FILE or dataset.path)\n";
                return 1;
            }
            LoadDataset(config_.dataset.path, config_.dataset.format);
        }

        Mine();
        ShowRules(config_.rules.top_n, ParseSortKey(config_.rules.sort_by));
    } catch (const std::exception& e) {
        err_ << C(Color::BOLD_RED) << "Error: " << e.what() << C(Color::RESET) << "\n";
        ++errors_reported_;
        return 1;
    }

    return 0;
}

void ARMinerCli::PrintWelcome() {
    out_ << C(Color::BOLD) << "ARMiner" << C(Color::RESET)
         << " - association rule mining\n";
    out_ << "Type '/help' for available commands.\n\n";

    if (store_) {
        out_ << "Dataset '" << dataset_name_ << "' loaded: "
             << store_->TransactionCount() << " transactions, "
             << store_->ItemCount() << " items\n\n";
    }
}

void ARMinerCli::ProcessCommand(const std::string& input) {
    // Trim surrounding whitespace
    auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return;
    auto last = input.find_last_not_of(" \t\r\n");
    std::string line = input.substr(first, last - first + 1);

    ++commands_processed_;

    // Commands are written "/cmd"; the slash is optional
    if (line[0] == '/') {
        line = line.substr(1);
    }

    try {
        HandleCommand(line);
    } catch (const std::exception& e) {
        err_ << C(Color::BOLD_RED) << "Error: " << e.what() << C(Color::RESET) << "\n";
        ++errors_reported_;
    }
}

void ARMinerCli::HandleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::string command;
    iss >> command;

    if (command == "help") {
        ShowHelp();
    } else if (command == "load") {
        std::string path, format;
        iss >> path >> format;
        if (path.empty()) {
            throw std::invalid_argument("Usage: /load <path> [basket|single]");
        }
        LoadDataset(path, format.empty() ? config_.dataset.format : format);
    } else if (command == "summary") {
        ShowSummary();
    } else if (command == "items") {
        std::string n;
        iss >> n;
        ShowItems(n.empty() ? 20 : ParseCount(n));
    } else if (command == "set") {
        std::string key, value;
        iss >> key;
        std::getline(iss >> std::ws, value);
        if (key.empty() || value.empty()) {
            throw std::invalid_argument("Usage: /set <key> <value>");
        }
        SetOption(key, value);
    } else if (command == "mine") {
        Mine();
    } else if (command == "itemsets") {
        std::string n;
        iss >> n;
        ShowItemsets(n.empty() ? config_.rules.top_n : ParseCount(n));
    } else if (command == "rules") {
        std::string n, key;
        iss >> n >> key;
        ShowRules(n.empty() ? config_.rules.top_n : ParseCount(n),
                  ParseSortKey(key.empty() ? config_.rules.sort_by : key));
    } else if (command == "redundant") {
        std::string n;
        iss >> n;
        ShowRedundant(n.empty() ? config_.rules.top_n : ParseCount(n));
    } else if (command == "lhs" || command == "rhs") {
        std::string items;
        std::getline(iss >> std::ws, items);
        RestrictSide(command == "lhs", items);
    } else if (command == "appearance") {
        std::string action;
        iss >> action;
        if (action == "clear") {
            lhs_allowed_.reset();
            rhs_allowed_.reset();
            out_ << "Side restriction cleared\n";
        } else {
            ShowAppearance();
        }
    } else if (command == "export") {
        std::string path;
        iss >> path;
        if (path.empty()) {
            throw std::invalid_argument("Usage: /export <file.csv>");
        }
        ExportRules(path);
    } else if (command == "save") {
        std::string db_path, name;
        iss >> db_path >> name;
        SaveToDatabase(db_path.empty() ? config_.storage.database_path : db_path,
                       name.empty() ? dataset_name_ : name);
    } else if (command == "open") {
        std::string db_path, name;
        iss >> db_path >> name;
        if (db_path.empty() || name.empty()) {
            throw std::invalid_argument("Usage: /open <db> <name>");
        }
        OpenFromDatabase(db_path, name);
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "quit" || command == "exit") {
        running_ = false;
    } else {
        out_ << "Unknown command: /" << command << "\n";
        out_ << "Type '/help' for available commands.\n";
    }
}

// ============================================================================
// Dataset
// ============================================================================

void ARMinerCli::LoadDataset(const std::string& path, const std::string& format) {
    BasketReader::Config reader_config;
    reader_config.format = ParseDatasetFormat(format);
    reader_config.separator = config_.dataset.separator;
    reader_config.has_header = config_.dataset.has_header;

    BasketReader reader(reader_config);
    TransactionStore store = reader.LoadFile(path);

    store_.emplace(std::move(store));
    dataset_name_ = std::filesystem::path(path).stem().string();
    result_.reset();
    last_stats_.reset();
    lhs_allowed_.reset();
    rhs_allowed_.reset();

    out_ << C(Color::GREEN) << "Loaded '" << dataset_name_ << "': " << C(Color::RESET)
         << store_->TransactionCount() << " transactions, "
         << store_->ItemCount() << " items\n";
}

void ARMinerCli::ShowSummary() {
    const TransactionStore& store = RequireStore();
    DatasetSummary summary = store.Summarize();

    out_ << "\nDataset: " << dataset_name_ << "\n";
    out_ << "  Transactions: " << summary.transaction_count << "\n";
    out_ << "  Items: " << summary.item_count << "\n";
    out_ << "  Density: " << std::fixed << std::setprecision(4) << summary.density << "\n";
    out_ << "  Transaction length: min " << summary.min_transaction_length
         << ", max " << summary.max_transaction_length
         << ", mean " << std::setprecision(2) << summary.mean_transaction_length << "\n";

    out_ << "  Length distribution:\n";
    for (const auto& [length, count] : summary.length_distribution) {
        out_ << "    " << std::setw(4) << length << ": " << count << "\n";
    }
    out_ << "\n";
}

void ARMinerCli::ShowItems(size_t n) {
    const TransactionStore& store = RequireStore();
    auto frequencies = store.ItemFrequencies();

    size_t shown = std::min(n, frequencies.size());
    out_ << "\nMost frequent items (" << shown << " of " << frequencies.size() << "):\n";
    for (size_t i = 0; i < shown; ++i) {
        const auto& f = frequencies[i];
        out_ << "  " << std::setw(4) << (i + 1) << ". "
             << std::left << std::setw(24) << store.Dictionary().Label(f.item) << std::right
             << " support " << std::fixed << std::setprecision(3) << f.support
             << " (" << f.count << ")\n";
    }
    out_ << "\n";
}

// ============================================================================
// Mining
// ============================================================================

void ARMinerCli::SetOption(const std::string& key, const std::string& value) {
    CliConfig updated = config_;
    if (!updated.SetValue(key, value)) {
        throw std::invalid_argument("Unknown option: " + key);
    }

    auto errors = updated.GetValidationErrors();
    if (!errors.empty()) {
        throw std::invalid_argument(errors.front());
    }

    config_ = updated;
    colors_enabled_ = config_.interface.colors_enabled;
    out_ << key << " = " << value << "\n";
}

void ARMinerCli::Mine() {
    const TransactionStore& store = RequireStore();

    RuleMiningEngine engine(config_.ToEngineConfig());
    if (config_.interface.verbose) {
        engine.SetDebugStream(&err_);
    }

    MiningResult result = engine.Run(store);
    const auto& stats = engine.GetStatistics();

    out_ << C(Color::GREEN) << "Mined " << result.itemsets.size() << " frequent itemsets and "
         << result.rules.Size() << " rules" << C(Color::RESET);
    if (config_.rules.remove_redundant) {
        out_ << " (" << result.redundant.Size() << " redundant removed)";
    }
    out_ << " in "
         << std::chrono::duration_cast<std::chrono::milliseconds>(
                stats.mining_time + stats.rule_time + stats.filter_time).count()
         << " ms\n";

    if (result.aborted) {
        out_ << C(Color::YELLOW)
             << "Itemset mining stopped early; results cover completed levels only"
             << C(Color::RESET) << "\n";
    }

    result_ = std::move(result);
    last_stats_ = stats;
}

void ARMinerCli::ShowItemsets(size_t n) {
    const TransactionStore& store = RequireStore();
    const MiningResult& result = RequireResult();

    std::vector<const FrequentItemset*> ranked;
    ranked.reserve(result.itemsets.size());
    for (const auto& itemset : result.itemsets) {
        ranked.push_back(&itemset);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const FrequentItemset* a, const FrequentItemset* b) {
            return a->support_count > b->support_count;
        });

    size_t shown = std::min(n, ranked.size());
    out_ << "\nFrequent itemsets (" << shown << " of " << ranked.size() << "):\n";
    for (size_t i = 0; i < shown; ++i) {
        out_ << "  " << std::setw(4) << (i + 1) << ". "
             << std::left << std::setw(32) << store.Dictionary().Format(ranked[i]->items)
             << std::right << " support " << std::fixed << std::setprecision(3)
             << ranked[i]->Support() << " (" << ranked[i]->support_count << ")\n";
    }
    out_ << "\n";
}

RuleSet ARMinerCli::VisibleRules() const {
    const MiningResult& result = RequireResult();
    if (!lhs_allowed_ && !rhs_allowed_) {
        return result.rules;
    }
    return RestrictAppearance(result.rules, lhs_allowed_, rhs_allowed_);
}

void ARMinerCli::ShowRules(size_t n, SortKey key) {
    RuleSet visible = VisibleRules();

    out_ << "\nRules by " << ToString(key) << " (" << std::min(n, visible.Size())
         << " of " << visible.Size() << "):\n";
    PrintRules(visible.TopN(n, key), n);
}

void ARMinerCli::ShowRedundant(size_t n) {
    const MiningResult& result = RequireResult();

    // Without removal at mine time the rules still hold the redundant ones
    RuleSet redundant = !result.redundant.IsEmpty()
        ? result.redundant
        : RedundancyFilter::Partition(result.rules).redundant;

    out_ << "\nRedundant rules (" << std::min(n, redundant.Size())
         << " of " << redundant.Size() << "):\n";
    PrintRules(redundant, n);
}

void ARMinerCli::RestrictSide(bool antecedent, const std::string& item_list) {
    const TransactionStore& store = RequireStore();
    const ItemDictionary& dictionary = store.Dictionary();

    auto labels = SplitItemList(item_list);
    if (labels.empty()) {
        throw std::invalid_argument(antecedent ? "Usage: /lhs <item> [item...]"
                                               : "Usage: /rhs <item> [item...]");
    }

    for (const auto& label : labels) {
        if (!dictionary.Find(label)) {
            out_ << C(Color::YELLOW) << "Unknown item ignored: " << label
                 << C(Color::RESET) << "\n";
        }
    }

    ItemSet allowed = dictionary.Resolve(labels);
    if (antecedent) {
        lhs_allowed_ = allowed;
    } else {
        rhs_allowed_ = allowed;
    }
    ShowAppearance();
}

void ARMinerCli::ShowAppearance() {
    auto describe = [this](const std::optional<ItemSet>& allowed) -> std::string {
        if (!allowed) {
            return "any";
        }
        const ItemDictionary& dictionary = RequireStore().Dictionary();
        return dictionary.Format(Itemset(allowed->begin(), allowed->end()));
    };

    out_ << "Antecedent items: " << describe(lhs_allowed_) << "\n";
    out_ << "Consequent items: " << describe(rhs_allowed_) << "\n";
}

// ============================================================================
// Output and persistence
// ============================================================================

void ARMinerCli::ExportRules(const std::string& path) {
    const TransactionStore& store = RequireStore();
    RuleSet visible = VisibleRules().SortBy(ParseSortKey(config_.rules.sort_by));

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    visible.WriteCsv(file, store.Dictionary());

    out_ << C(Color::GREEN) << "Wrote " << visible.Size() << " rules to " << path
         << C(Color::RESET) << "\n";
}

void ARMinerCli::SaveToDatabase(const std::string& db_path, const std::string& name) {
    const TransactionStore& store = RequireStore();
    if (name.empty()) {
        throw std::invalid_argument("Usage: /save <db> <name>");
    }

    PersistentBackend::Config storage_config;
    storage_config.db_path = db_path;
    PersistentBackend backend(storage_config);

    if (!backend.SaveDataset(name, store)) {
        throw std::runtime_error("Failed to save dataset '" + name + "'");
    }

    if (result_) {
        RuleSetParams params;
        params.min_support = config_.mining.min_support;
        params.min_confidence = config_.rules.min_confidence;
        if (!backend.SaveRuleSet(name, kRuleSetName, result_->rules, params)) {
            throw std::runtime_error("Failed to save rules of '" + name + "'");
        }
    }
    backend.Flush();

    out_ << C(Color::GREEN) << "Saved '" << name << "'" << (result_ ? " with rules" : "")
         << " to " << db_path << C(Color::RESET) << "\n";
}

void ARMinerCli::OpenFromDatabase(const std::string& db_path, const std::string& name) {
    if (!std::filesystem::exists(db_path)) {
        throw std::runtime_error("No database at " + db_path);
    }

    PersistentBackend::Config storage_config;
    storage_config.db_path = db_path;
    PersistentBackend backend(storage_config);

    auto store = backend.LoadDataset(name);
    if (!store) {
        throw std::runtime_error("No dataset '" + name + "' in " + db_path);
    }

    store_.emplace(std::move(*store));
    dataset_name_ = name;
    result_.reset();
    last_stats_.reset();
    lhs_allowed_.reset();
    rhs_allowed_.reset();

    auto rules = backend.LoadRuleSet(name, kRuleSetName);
    if (rules) {
        MiningResult result;
        result.rules = std::move(*rules);
        result_ = std::move(result);

        auto params = backend.GetRuleSetParams(name, kRuleSetName);
        if (params) {
            config_.mining.min_support = params->min_support;
            config_.rules.min_confidence = params->min_confidence;
        }
    }

    out_ << C(Color::GREEN) << "Opened '" << name << "': " << C(Color::RESET)
         << store_->TransactionCount() << " transactions, " << store_->ItemCount() << " items";
    if (result_) {
        out_ << ", " << result_->rules.Size() << " stored rules";
    }
    out_ << "\n";
}

void ARMinerCli::ShowStatistics() {
    out_ << "\nSession:\n";
    out_ << "  Commands processed: " << commands_processed_ << "\n";
    out_ << "  Errors: " << errors_reported_ << "\n";

    out_ << "\nSettings:\n";
    out_ << "  min_support: " << config_.mining.min_support << "\n";
    out_ << "  min_confidence: " << config_.rules.min_confidence << "\n";
    out_ << "  length: " << config_.mining.min_len << ".." << config_.mining.max_len << "\n";
    out_ << "  counting: " << config_.mining.counting
         << " (" << config_.mining.num_threads << " thread(s))\n";

    if (store_) {
        out_ << "\nDataset '" << dataset_name_ << "': " << store_->TransactionCount()
             << " transactions, " << store_->ItemCount() << " items\n";
    }

    if (last_stats_) {
        const auto& stats = *last_stats_;
        out_ << "\nLast run:\n";
        out_ << "  Minimum support count: " << stats.mining.min_support_count << "\n";
        for (const auto& level : stats.mining.levels) {
            out_ << "  Level " << level.level << ": "
                 << level.candidates_generated << " candidates, "
                 << level.candidates_pruned << " pruned, "
                 << level.frequent_found << " frequent\n";
        }
        out_ << "  Rules generated: " << stats.rules_generated << "\n";
        out_ << "  Redundant removed: " << stats.redundant_removed << "\n";
        out_ << "  Mining time: " << stats.mining_time.count() << " us\n";
        out_ << "  Rule time: " << stats.rule_time.count() << " us\n";
        if (stats.mining.aborted) {
            out_ << "  (aborted)\n";
        }
    }
    out_ << "\n";
}

void ARMinerCli::ShowHelp() {
    out_ << R"(
Available Commands:
===================

Data:
  /load <path> [basket|single]   Load a transaction file
  /summary                       Dataset statistics
  /items [n]                     Most frequent items

Mining:
  /set <key> <value>             Change a setting (e.g. /set min_support 0.05)
  /mine                          Mine frequent itemsets and rules
  /itemsets [n]                  Show frequent itemsets

Rules:
  /rules [n] [support|confidence|lift]   Show top rules
  /redundant [n]                 Show redundant rules
  /lhs <items>                   Only rules with antecedent items from this list
  /rhs <items>                   Only rules with consequent items from this list
  /appearance [clear]            Show or clear the side restriction
  /export <file.csv>             Write shown rules as CSV

Storage:
  /save [db] [name]              Store dataset and rules in SQLite
  /open <db> <name>              Load a stored dataset and its rules

Utility:
  /stats                         Session and last-run statistics
  /help                          Show this help
  /quit, /exit                   Exit the program

)";
}

// ============================================================================
// Utilities
// ============================================================================

const TransactionStore& ARMinerCli::RequireStore() const {
    if (!store_) {
        throw std::runtime_error("No dataset loaded (use /load <path>)");
    }
    return *store_;
}

const MiningResult& ARMinerCli::RequireResult() const {
    if (!result_) {
        throw std::runtime_error("Nothing mined yet (use /mine)");
    }
    return *result_;
}

void ARMinerCli::PrintRules(const RuleSet& rules, size_t n) {
    const ItemDictionary& dictionary = RequireStore().Dictionary();

    size_t shown = std::min(n, rules.Size());
    for (size_t i = 0; i < shown; ++i) {
        const AssociationRule& rule = rules[i];
        out_ << "  " << std::setw(4) << (i + 1) << ". "
             << std::left << std::setw(40) << rule.ToString(dictionary) << std::right
             << std::fixed << std::setprecision(3)
             << " support " << rule.Support()
             << "  confidence " << rule.Confidence()
             << "  lift " << rule.Lift()
             << "  count " << rule.SupportCount() << "\n";
    }
    if (shown == 0) {
        out_ << C(Color::DIM) << "  (none)" << C(Color::RESET) << "\n";
    }
    out_ << "\n";
}

std::vector<std::string> ARMinerCli::SplitItemList(const std::string& text) {
    std::vector<std::string> labels;

    // Comma-separated if there is a comma (labels may contain spaces), else whitespace
    const bool by_comma = text.find(',') != std::string::npos;
    std::string current;

    auto flush = [&labels, &current]() {
        auto first = current.find_first_not_of(" \t");
        if (first != std::string::npos) {
            auto last = current.find_last_not_of(" \t");
            labels.push_back(current.substr(first, last - first + 1));
        }
        current.clear();
    };

    for (char c : text) {
        bool separator = by_comma ? c == ',' : (c == ' ' || c == '\t');
        if (separator) {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    return labels;
}

} // namespace arminer
