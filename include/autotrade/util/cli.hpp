#pragma once

/**
 * Command-line parsing for the autotrade engine
 */

#include "string_utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace autotrade {
namespace util {

/**
 * Command-line arguments for the engine.
 */
struct CLIArgs {
    std::string config_path;       // empty = built-in defaults + environment credentials
    int instances = 1;
    std::vector<std::string> pairs; // overrides trading_pair, one per instance (cycled)
    std::string strategy;           // overrides default_strategy
    int duration = 0;               // 0 = unlimited
    bool dry_run = false;
    bool verbose = false;
    bool help = false;
};

inline void print_help() {
    std::cout << R"(
Autotrade Engine
================

Usage: autotrade [options]

Options:
  -c, --config PATH      JSON config file (default: built-in defaults)
  -n, --instances N      Number of trading instances (default: 1)
  -p, --pair SYMS        Trading pair(s), comma-separated (e.g. BTC_USDT,ETH_USDT)
  -s, --strategy NAME    Strategy: RSI_STRATEGY, RSI_MULTI_TF, VOLUME_FILTER,
                         ADVANCED_STRATEGY, GRID_TRADING, DCA
  -d, --duration SECS    Run time in seconds (0 = until SIGINT/SIGTERM)
  --dry-run              One cycle per instance, no streaming feed
  -v, --verbose          Debug logging
  -h, --help             Show this help

Credentials are read from the config file or from
PIONEX_API_KEY / PIONEX_SECRET_KEY.

Examples:
  autotrade --config trading.json
  autotrade -c trading.json -n 2 -p BTC_USDT,ETH_USDT -s RSI_STRATEGY
  autotrade --dry-run -v

WARNING: Without --dry-run, REAL orders are sent!
)";
}

/**
 * Parse command-line arguments into CLIArgs.
 *
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
            } else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            } else if (arg == "--dry-run") {
                args.dry_run = true;
            } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if ((arg == "--instances" || arg == "-n") && i + 1 < argc) {
                args.instances = std::stoi(argv[++i]);
            } else if ((arg == "--pair" || arg == "-p") && i + 1 < argc) {
                args.pairs = split_symbols(argv[++i]);
            } else if ((arg == "--strategy" || arg == "-s") && i + 1 < argc) {
                args.strategy = to_upper(argv[++i]);
            } else if ((arg == "--duration" || arg == "-d") && i + 1 < argc) {
                args.duration = std::stoi(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            return false;
        }
    }

    if (args.instances < 1) {
        std::cerr << "--instances must be at least 1\n";
        return false;
    }
    if (args.duration < 0) {
        std::cerr << "--duration must not be negative\n";
        return false;
    }
    return true;
}

}  // namespace util
}  // namespace autotrade
