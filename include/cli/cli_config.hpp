// File: include/cli/cli_config.hpp
//
// YAML Configuration Support for the ARMiner CLI
// Allows loading dataset, mining and rule settings from YAML configuration files

#ifndef ARMINER_CLI_CONFIG_HPP
#define ARMINER_CLI_CONFIG_HPP

#include "core/rule_mining_engine.hpp"
#include <string>
#include <optional>
#include <vector>

namespace arminer {

/// Configuration structure for the ARMiner CLI
struct CliConfig {
    // === Interface Settings ===
    struct Interface {
        std::string prompt = "arminer> ";
        bool colors_enabled = true;
        bool verbose = false;
    } interface;

    // === Dataset Settings ===
    struct Dataset {
        std::string path;                  // Loaded at startup when set
        std::string format = "basket";     // basket | single
        char separator = ',';
        bool has_header = false;
    } dataset;

    // === Itemset Mining Settings ===
    struct Mining {
        double min_support = 0.1;
        size_t min_len = 1;
        size_t max_len = 10;
        size_t num_threads = 1;
        std::string counting = "tidlist";  // tidlist | scan
        size_t time_limit_ms = 0;          // 0 = unlimited
    } mining;

    // === Rule Settings ===
    struct Rules {
        double min_confidence = 0.8;
        bool prune_consequents = false;
        size_t max_consequent_size = 0;    // 0 = unbounded
        bool remove_redundant = false;
        std::string sort_by = "confidence";
        size_t top_n = 10;                 // Rules shown by default
    } rules;

    // === Storage Settings ===
    struct Storage {
        std::string database_path = "arminer.db";
    } storage;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Set one value by "section.key" or by bare key ("min_support")
    /// @return false if the key is unknown
    /// @throws std::invalid_argument or std::out_of_range if the value cannot be parsed
    bool SetValue(const std::string& key, const std::string& value);

    /// Build the engine configuration from the mining and rule sections
    /// @throws InvalidParameterError if a named strategy or sort key is unknown
    RuleMiningEngine::Config ToEngineConfig() const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace arminer

#endif // ARMINER_CLI_CONFIG_HPP
