//! # Checker Configuration
//!
//! Loads settings from `pmc.toml` and the command line.
//!
//! ## Configuration Section
//!
//! ```toml
//! [pmc]
//! annoy = true              # report every rule
//! select = "PMC001,PMC002"  # or ["PMC001", "PMC002"]
//! ignore = "PMC005"
//! format = "json"
//! jobs = 4
//! color = false
//! ```
//!
//! Keys may be spelled with `-` or `_`. Other sections are ignored.

#include "cli/cli.hpp"
#include "log/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace pmc::cli {

namespace {

auto trim(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

/// Cuts a trailing `# comment` that is not inside a string.
auto strip_comment(std::string_view line) -> std::string_view {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            in_string = !in_string;
        } else if (line[i] == '#' && !in_string) {
            return line.substr(0, i);
        }
    }
    return line;
}

auto unquote(std::string_view value) -> std::string {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return std::string(value.substr(1, value.size() - 2));
    }
    return std::string(value);
}

auto parse_bool(std::string_view value) -> std::optional<bool> {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    return std::nullopt;
}

auto parse_format(std::string_view value) -> std::optional<OutputFormat> {
    if (value == "text" || value == "default") {
        return OutputFormat::Text;
    }
    if (value == "json") {
        return OutputFormat::Json;
    }
    return std::nullopt;
}

auto parse_jobs(std::string_view value) -> std::optional<int> {
    int jobs = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
    if (ec != std::errc{} || ptr != value.data() + value.size() || jobs < 0) {
        return std::nullopt;
    }
    return jobs;
}

auto normalize_key(std::string_view key) -> std::string {
    std::string result(key);
    for (char& c : result) {
        if (c == '-') {
            c = '_';
        }
    }
    return result;
}

} // namespace

// ============================================================================
// Config File Parsing
// ============================================================================

auto split_code_list(std::string_view text) -> std::vector<std::string> {
    text = trim(text);
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        text = text.substr(1, text.size() - 2);
    }

    std::vector<std::string> codes;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string_view item =
            text.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                               : comma - start);
        std::string code = unquote(trim(item));
        if (!code.empty()) {
            codes.push_back(std::move(code));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return codes;
}

auto parse_config_text(std::string_view text, CheckOptions& options) -> std::vector<std::string> {
    std::vector<std::string> problems;
    bool in_pmc_section = false;
    size_t line_number = 0;

    std::istringstream stream{std::string(text)};
    std::string raw;
    while (std::getline(stream, raw)) {
        ++line_number;
        std::string_view line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            in_pmc_section = (line == "[pmc]");
            continue;
        }
        if (!in_pmc_section) {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            problems.push_back("line " + std::to_string(line_number) + ": expected 'key = value'");
            continue;
        }

        std::string key = normalize_key(trim(line.substr(0, eq_pos)));
        std::string_view raw_value = trim(line.substr(eq_pos + 1));
        std::string value = unquote(raw_value);

        auto invalid = [&]() {
            problems.push_back("line " + std::to_string(line_number) + ": invalid value for '" +
                               key + "': " + std::string(raw_value));
        };

        if (key == "annoy") {
            if (auto flag = parse_bool(value)) {
                options.annoy = *flag;
            } else {
                invalid();
            }
        } else if (key == "select") {
            options.select = split_code_list(raw_value);
        } else if (key == "ignore") {
            options.ignore = split_code_list(raw_value);
        } else if (key == "format") {
            if (auto format = parse_format(value)) {
                options.format = *format;
            } else {
                invalid();
            }
        } else if (key == "jobs") {
            if (auto jobs = parse_jobs(value)) {
                options.jobs = *jobs;
            } else {
                invalid();
            }
        } else if (key == "color") {
            if (auto flag = parse_bool(value)) {
                options.color = *flag;
            } else {
                invalid();
            }
        } else {
            problems.push_back("line " + std::to_string(line_number) + ": unknown key '" + key +
                               "'");
        }
    }

    return problems;
}

auto load_config_file(const fs::path& path, CheckOptions& options) -> Result<bool, std::string> {
    std::ifstream file(path);
    if (!file) {
        return "cannot read config file: " + path.string();
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    for (const auto& problem : parse_config_text(buffer.str(), options)) {
        PMC_LOG_WARN("config", path.string() << ": " << problem);
    }
    PMC_LOG_DEBUG("config", "Loaded " << path.string());
    return true;
}

// ============================================================================
// Command Line
// ============================================================================

auto parse_command_line(const std::vector<std::string>& args) -> Result<CommandLine, std::string> {
    CommandLine cmd;

    // The configuration file comes first so that flags override it.
    std::optional<std::string> config_path;
    for (const auto& arg : args) {
        if (arg.starts_with("--config=")) {
            config_path = arg.substr(9);
        }
    }
    std::error_code exists_error;
    if (config_path) {
        auto loaded = load_config_file(*config_path, cmd.options);
        if (is_err(loaded)) {
            return unwrap_err(loaded);
        }
    } else if (fs::exists(CONFIG_FILE_NAME, exists_error)) {
        auto loaded = load_config_file(CONFIG_FILE_NAME, cmd.options);
        if (is_err(loaded)) {
            return unwrap_err(loaded);
        }
    }

    auto& options = cmd.options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (log::is_log_option(arg) || arg.starts_with("--config=")) {
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            cmd.show_version = true;
        } else if (arg == "--annoy") {
            options.annoy = true;
        } else if (arg.starts_with("--select=")) {
            options.select = split_code_list(arg.substr(9));
        } else if (arg.starts_with("--ignore=")) {
            options.ignore = split_code_list(arg.substr(9));
        } else if (arg.starts_with("--format=")) {
            auto format = parse_format(arg.substr(9));
            if (!format) {
                return "invalid --format value: " + arg.substr(9);
            }
            options.format = *format;
        } else if (arg.starts_with("--jobs=") || (arg.starts_with("-j") && arg.size() > 2)) {
            std::string value = arg.starts_with("--jobs=") ? arg.substr(7) : arg.substr(2);
            auto jobs = parse_jobs(value);
            if (!jobs) {
                return "invalid job count: " + value;
            }
            options.jobs = *jobs;
        } else if (arg == "-j" || arg == "--jobs") {
            if (i + 1 >= args.size()) {
                return arg + " requires a value";
            }
            auto jobs = parse_jobs(args[++i]);
            if (!jobs) {
                return "invalid job count: " + args[i];
            }
            options.jobs = *jobs;
        } else if (arg == "--no-color") {
            options.color = false;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "unknown option: " + arg;
        } else {
            options.paths.push_back(arg);
        }
    }

    if (options.paths.empty()) {
        options.paths.emplace_back(".");
    }

    return cmd;
}

} // namespace pmc::cli
