// File: src/cli/main.cpp
//
// Entry point for the arminer command line tool
//
// Usage: arminer [--config FILE] [--data FILE] [--format basket|single] [--batch]

#include "cli/arminer_cli.hpp"
#include "cli/cli_config.hpp"
#include <iostream>
#include <string>

using namespace arminer;

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config FILE] [--data FILE] [--format basket|single] [--batch]\n\n"
              << "  --config FILE   Load settings from a YAML file\n"
              << "  --data FILE     Load a transaction file at startup\n"
              << "  --format NAME   Layout of the data file (default: basket)\n"
              << "  --batch         Mine, print the top rules and exit\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string data_path;
    std::string format;
    bool batch = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--data" || arg == "-d") && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--batch") {
            batch = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        }
    }

    try {
        CliConfig config = CliConfig::Default();
        if (!config_path.empty()) {
            auto loaded = CliConfig::LoadFromFile(config_path);
            if (!loaded) {
                return 1;
            }
            config = *loaded;
        }

        if (!data_path.empty()) {
            config.dataset.path = data_path;
        }
        if (!format.empty()) {
            config.dataset.format = format;
        }

        ARMinerCli cli(config);
        if (batch) {
            return cli.RunBatch();
        }

        if (!config.dataset.path.empty()) {
            cli.LoadDataset(config.dataset.path, config.dataset.format);
        }
        cli.Run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
