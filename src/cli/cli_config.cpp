// File: src/cli/cli_config.cpp
//
// YAML Configuration Implementation for the ARMiner CLI

#include "cli/cli_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace arminer {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Non-negative integer; std::stoul alone would wrap "-1" to SIZE_MAX
static size_t ParseCount(const std::string& value) {
    size_t first = value.find_first_not_of(" \t");
    if (first != std::string::npos && (value[first] == '-' || value[first] == '+')) {
        throw std::invalid_argument("expected a non-negative integer");
    }
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (value.find_first_not_of(" \t", consumed) != std::string::npos) {
        throw std::invalid_argument("expected a non-negative integer");
    }
    if (parsed > std::numeric_limits<size_t>::max()) {
        throw std::out_of_range("value too large");
    }
    return static_cast<size_t>(parsed);
}

// Separator may be written as a single character or as "tab"/"\t"
static char ParseSeparator(const std::string& value) {
    if (value == "tab" || value == "\\t" || value == "\t") {
        return '\t';
    }
    if (value.size() != 1) {
        throw std::invalid_argument("separator must be a single character");
    }
    return value[0];
}

static std::string SeparatorToString(char separator) {
    return separator == '\t' ? std::string("tab") : std::string(1, separator);
}

// Apply one key/value pair
// @return false if the section or key is unknown
static bool ApplyValue(CliConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "interface") {
        if (key == "prompt") config.interface.prompt = value;
        else if (key == "colors_enabled") config.interface.colors_enabled = ParseBool(value);
        else if (key == "verbose") config.interface.verbose = ParseBool(value);
        else return false;
    }
    else if (section == "dataset") {
        if (key == "path") config.dataset.path = value;
        else if (key == "format") config.dataset.format = value;
        else if (key == "separator") config.dataset.separator = ParseSeparator(value);
        else if (key == "has_header") config.dataset.has_header = ParseBool(value);
        else return false;
    }
    else if (section == "mining") {
        if (key == "min_support") config.mining.min_support = std::stod(value);
        else if (key == "min_len") config.mining.min_len = ParseCount(value);
        else if (key == "max_len") config.mining.max_len = ParseCount(value);
        else if (key == "num_threads") config.mining.num_threads = ParseCount(value);
        else if (key == "counting") config.mining.counting = value;
        else if (key == "time_limit_ms") config.mining.time_limit_ms = ParseCount(value);
        else return false;
    }
    else if (section == "rules") {
        if (key == "min_confidence") config.rules.min_confidence = std::stod(value);
        else if (key == "prune_consequents") config.rules.prune_consequents = ParseBool(value);
        else if (key == "max_consequent_size") config.rules.max_consequent_size = ParseCount(value);
        else if (key == "remove_redundant") config.rules.remove_redundant = ParseBool(value);
        else if (key == "sort_by") config.rules.sort_by = value;
        else if (key == "top_n") config.rules.top_n = ParseCount(value);
        else return false;
    }
    else if (section == "storage") {
        if (key == "database_path") config.storage.database_path = value;
        else return false;
    }
    else {
        return false;
    }
    return true;
}

static const char* const kSections[] = {"interface", "dataset", "mining", "rules", "storage"};

std::optional<CliConfig> CliConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CliConfig> CliConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    CliConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error: "
                      << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            if (!ApplyValue(config, current_section, current_key, value)) {
                                std::cerr << "Ignoring unknown config key: " << current_section
                                          << "." << current_key << std::endl;
                            }
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": " << value
                                      << " (" << e.what() << ")" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool CliConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string CliConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# ARMiner CLI Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "interface:\n";
    ss << "  prompt: \"" << interface.prompt << "\"\n";
    ss << "  colors_enabled: " << (interface.colors_enabled ? "true" : "false") << "\n";
    ss << "  verbose: " << (interface.verbose ? "true" : "false") << "\n\n";

    ss << "dataset:\n";
    ss << "  path: \"" << dataset.path << "\"\n";
    ss << "  format: \"" << dataset.format << "\"\n";
    ss << "  separator: \"" << SeparatorToString(dataset.separator) << "\"\n";
    ss << "  has_header: " << (dataset.has_header ? "true" : "false") << "\n\n";

    ss << "mining:\n";
    ss << "  min_support: " << mining.min_support << "\n";
    ss << "  min_len: " << mining.min_len << "\n";
    ss << "  max_len: " << mining.max_len << "\n";
    ss << "  num_threads: " << mining.num_threads << "\n";
    ss << "  counting: \"" << mining.counting << "\"\n";
    ss << "  time_limit_ms: " << mining.time_limit_ms << "\n\n";

    ss << "rules:\n";
    ss << "  min_confidence: " << rules.min_confidence << "\n";
    ss << "  prune_consequents: " << (rules.prune_consequents ? "true" : "false") << "\n";
    ss << "  max_consequent_size: " << rules.max_consequent_size << "\n";
    ss << "  remove_redundant: " << (rules.remove_redundant ? "true" : "false") << "\n";
    ss << "  sort_by: \"" << rules.sort_by << "\"\n";
    ss << "  top_n: " << rules.top_n << "\n\n";

    ss << "storage:\n";
    ss << "  database_path: \"" << storage.database_path << "\"\n";

    return ss.str();
}

bool CliConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CliConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Dataset layout
    if (dataset.format != "basket" && dataset.format != "single") {
        errors.push_back("dataset format must be one of: basket, single");
    }

    // Thresholds
    if (!(mining.min_support > 0.0 && mining.min_support <= 1.0)) {
        errors.push_back("min_support must be in (0.0, 1.0]");
    }
    if (!(rules.min_confidence > 0.0 && rules.min_confidence <= 1.0)) {
        errors.push_back("min_confidence must be in (0.0, 1.0]");
    }

    // Length bounds
    if (mining.min_len == 0) {
        errors.push_back("min_len must be greater than 0");
    }
    if (mining.max_len < mining.min_len) {
        errors.push_back("max_len must be >= min_len");
    }

    if (mining.num_threads == 0) {
        errors.push_back("num_threads must be greater than 0");
    }
    if (mining.counting != "tidlist" && mining.counting != "scan") {
        errors.push_back("counting must be one of: tidlist, scan");
    }

    if (rules.sort_by != "support" && rules.sort_by != "confidence" && rules.sort_by != "lift") {
        errors.push_back("sort_by must be one of: support, confidence, lift");
    }

    if (storage.database_path.empty()) {
        errors.push_back("database_path must not be empty");
    }

    return errors;
}

bool CliConfig::SetValue(const std::string& key, const std::string& value) {
    auto dot = key.find('.');
    if (dot != std::string::npos) {
        return ApplyValue(*this, key.substr(0, dot), key.substr(dot + 1), value);
    }

    // Bare key: first section that knows it
    for (const char* section : kSections) {
        CliConfig updated = *this;
        if (ApplyValue(updated, section, key, value)) {
            *this = updated;
            return true;
        }
    }
    return false;
}

RuleMiningEngine::Config CliConfig::ToEngineConfig() const {
    RuleMiningEngine::Config config;

    config.mining.min_support = mining.min_support;
    config.mining.min_len = mining.min_len;
    config.mining.max_len = mining.max_len;
    config.mining.num_threads = mining.num_threads;
    config.mining.counting = ParseCountingStrategy(mining.counting);
    config.mining.time_limit = std::chrono::milliseconds(mining.time_limit_ms);

    config.rules.min_confidence = rules.min_confidence;
    config.rules.prune_consequents = rules.prune_consequents;
    config.rules.max_consequent_size = rules.max_consequent_size;

    config.remove_redundant = rules.remove_redundant;
    config.sort_by = ParseSortKey(rules.sort_by);
    config.debug_logging = interface.verbose;

    return config;
}

CliConfig CliConfig::Default() {
    return CliConfig{};  // Uses default member initializers
}

} // namespace arminer
