//! # CLI Helper Functions
//!
//! ANSI color codes and the `--help` / `--version` text.

#include "cli/cli.hpp"

#include <iostream>

namespace pmc::cli {

// ============================================================================
// ANSI Colors
// ============================================================================

const char* RED = "\033[31m";
const char* DIM = "\033[2m";
const char* BOLD = "\033[1m";
const char* RESET = "\033[0m";

// ============================================================================
// Help
// ============================================================================

void print_help() {
    std::cout << "Usage: pmc-lint [options] [paths...]\n\n"
              << "Check Python syntax trees (JSON dumps of `ast.parse`) for pandas\n"
              << "code that could use method chaining.\n\n"
              << "Options:\n"
              << "  --annoy           Report all PMC rules (ignored by default)\n"
              << "  --select=CODES    Report only these code prefixes (comma separated)\n"
              << "  --ignore=CODES    Never report these code prefixes\n"
              << "  --format=FORMAT   Output format: text (default) or json\n"
              << "  --jobs=N, -j N    Worker threads (default: one per CPU)\n"
              << "  --config=PATH     Configuration file (default: ./pmc.toml)\n"
              << "  --no-color        Disable colored output\n"
              << "  --version, -V     Show version\n"
              << "  --help, -h        Show this help\n\n"
              << "Logging:\n"
              << "  --log-level=LEVEL     trace, debug, info, warn, error, off\n"
              << "  --log-filter=SPEC     Per-module levels, e.g. engine=trace,*=warn\n"
              << "  --log-file=PATH       Also write log records to a file\n"
              << "  --log-format=FORMAT   text or json\n"
              << "  -v, -vv, -vvv         info, debug, trace\n"
              << "  -q, --quiet           Errors only\n\n"
              << "Directories are searched recursively for *.json files.\n"
              << "If no paths are specified, checks the current directory.\n\n"
              << "Rules:\n";
    for (rules::RuleId id : rules::ALL_RULES) {
        std::cout << "  " << rules::rule_code(id) << "  " << rules::rule_message(id) << "\n";
    }
    std::cout << "\nExit status: 0 clean, 1 findings, 2 errors.\n";
}

void print_version() {
    std::cout << "pmc-lint " << VERSION << " (" << PLUGIN_NAME << ")\n";
}

} // namespace pmc::cli
