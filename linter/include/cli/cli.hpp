//! # Checker Command Line
//!
//! Host side of the checker: options, `pmc.toml` configuration, rule
//! selection, input discovery, parallel checking and reporting.
//!
//! ## Check Flow
//!
//! ```text
//! pmc_main()
//!   ├─ parse_log_options() → Logger::init()
//!   ├─ parse_command_line()   - pmc.toml first, flags override
//!   ├─ discover_inputs()      - files and directories of *.json trees
//!   ├─ check_files()          - worker pool, one RuleEngine shared by all
//!   │     └─ check_file()     - read → load → run → select
//!   ├─ write_text_report() / write_json_report()
//!   └─ exit_code()
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | No findings |
//! | 1 | Findings reported |
//! | 2 | An input failed to load or check, or the command line was invalid |

#ifndef PMC_CLI_HPP
#define PMC_CLI_HPP

#include "common.hpp"
#include "engine/engine.hpp"
#include "rules/finding.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pmc::cli {

namespace fs = std::filesystem;

// ============================================================================
// ANSI Colors
// ============================================================================

extern const char* RED;
extern const char* DIM;
extern const char* BOLD;
extern const char* RESET;

// ============================================================================
// Options
// ============================================================================

enum class OutputFormat { Text, Json };

/// Effective settings of one invocation.
struct CheckOptions {
    /// Enable every PMC rule (they are all ignored by default).
    bool annoy = false;

    /// Code prefixes to report (`PMC00` selects PMC001..PMC009).
    std::vector<std::string> select;

    /// Code prefixes never reported. Wins over `select` and `annoy`.
    std::vector<std::string> ignore;

    OutputFormat format = OutputFormat::Text;

    /// Worker threads; 0 means one per hardware thread.
    int jobs = 0;

    bool color = true;

    /// Files and directories to check.
    std::vector<std::string> paths;
};

/// Result of parsing the command line.
struct CommandLine {
    CheckOptions options;
    bool show_help = false;
    bool show_version = false;
};

/// Default configuration file, looked up in the working directory.
constexpr const char* CONFIG_FILE_NAME = "pmc.toml";

/// Applies the `[pmc]` section of a configuration text to `options`.
///
/// Returns one message per line that could not be applied (unknown key,
/// invalid value); the remaining lines still take effect.
[[nodiscard]] auto parse_config_text(std::string_view text, CheckOptions& options)
    -> std::vector<std::string>;

/// Reads and applies a configuration file. Fails if the file cannot be read.
[[nodiscard]] auto load_config_file(const fs::path& path, CheckOptions& options)
    -> Result<bool, std::string>;

/// Parses the arguments after the program name. Logging options are
/// skipped (see `log::parse_log_options`). The configuration file named by
/// `--config=` (or `pmc.toml` if present) is applied before the flags.
[[nodiscard]] auto parse_command_line(const std::vector<std::string>& args)
    -> Result<CommandLine, std::string>;

/// Splits `"PMC001, PMC002"` or `["PMC001", "PMC002"]` into codes.
[[nodiscard]] auto split_code_list(std::string_view text) -> std::vector<std::string>;

// ============================================================================
// Rule Selection
// ============================================================================

/// Decides which rule codes are reported, by code prefix.
///
/// A code is reported when it matches no `ignore` prefix and either matches
/// a `select` prefix or, with no `select` given, `annoy` is on.
class RuleSelection {
public:
    RuleSelection(bool annoy, std::vector<std::string> select, std::vector<std::string> ignore);

    explicit RuleSelection(const CheckOptions& options)
        : RuleSelection(options.annoy, options.select, options.ignore) {}

    [[nodiscard]] auto is_selected(std::string_view code) const -> bool;

    /// Number of the seven rules that can be reported.
    [[nodiscard]] auto selected_count() const -> size_t;

    /// Keeps the findings whose code is selected, preserving order.
    [[nodiscard]] auto filter(std::vector<rules::Finding> findings) const
        -> std::vector<rules::Finding>;

private:
    bool annoy_;
    std::vector<std::string> select_;
    std::vector<std::string> ignore_;
};

// ============================================================================
// Checking
// ============================================================================

/// Outcome of checking one input file.
struct FileReport {
    /// Name shown in the report: the envelope's `filename`, or the path.
    std::string display_name;

    /// Selected findings in visit order.
    std::vector<rules::Finding> findings;

    /// Load or engine error, if the file could not be checked.
    std::optional<std::string> error;
};

/// Expands `paths` into input files: regular files as given, directories
/// searched recursively for `*.json`. Missing paths are logged and make the
/// result `false`; the other paths are still expanded.
[[nodiscard]] auto discover_inputs(const std::vector<std::string>& paths,
                                   std::vector<fs::path>& files) -> bool;

/// Checks a JSON tree given as text. `fallback_name` is used when the
/// document has no `filename`.
[[nodiscard]] auto check_text(std::string_view text, const std::string& fallback_name,
                              const engine::RuleEngine& engine, const RuleSelection& selection)
    -> FileReport;

/// Reads and checks one file.
[[nodiscard]] auto check_file(const fs::path& path, const engine::RuleEngine& engine,
                              const RuleSelection& selection) -> FileReport;

/// Checks files on `jobs` worker threads. Reports are in input order.
[[nodiscard]] auto check_files(const std::vector<fs::path>& files,
                               const engine::RuleEngine& engine, const RuleSelection& selection,
                               int jobs) -> std::vector<FileReport>;

// ============================================================================
// Reporting
// ============================================================================

/// Writes `name:line:col: CODE message` lines, the column 1-based, and a
/// `name: error: message` line for each file that could not be checked.
void write_text_report(std::ostream& out, const std::vector<FileReport>& reports, bool color);

/// Writes a JSON array of `{filename, line, column, code, message}`
/// findings and `{filename, error}` entries, in report order.
void write_json_report(std::ostream& out, const std::vector<FileReport>& reports);

/// Exit code for a finished run.
[[nodiscard]] auto exit_code(const std::vector<FileReport>& reports, bool inputs_ok) -> int;

// ============================================================================
// Help
// ============================================================================

void print_help();
void print_version();

} // namespace pmc::cli

#endif // PMC_CLI_HPP
