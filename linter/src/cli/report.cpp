//! # Reporters
//!
//! Findings and per-file errors are program output and go to stdout. The
//! driver also logs each error, so it reaches a log file too.

#include "cli/cli.hpp"
#include "json/json_value.hpp"

namespace pmc::cli {

void write_text_report(std::ostream& out, const std::vector<FileReport>& reports, bool color) {
    for (const auto& report : reports) {
        if (report.error) {
            if (color) {
                out << BOLD << report.display_name << RESET << DIM << ":" << RESET << " " << RED
                    << "error" << RESET << DIM << ":" << RESET << " " << *report.error << "\n";
            } else {
                out << report.display_name << ": error: " << *report.error << "\n";
            }
        }
        for (const auto& finding : report.findings) {
            // Columns are printed 1-based, as flake8 does.
            uint32_t column = finding.location.column + 1;
            if (color) {
                out << BOLD << report.display_name << RESET << DIM << ":" << RESET
                    << finding.location.line << DIM << ":" << RESET << column << DIM << ":"
                    << RESET << " " << RED << finding.code() << RESET << " " << finding.message
                    << "\n";
            } else {
                out << report.display_name << ":" << finding.location.line << ":" << column
                    << ": " << finding.code() << " " << finding.message << "\n";
            }
        }
    }
}

void write_json_report(std::ostream& out, const std::vector<FileReport>& reports) {
    json::JsonArray entries;
    for (const auto& report : reports) {
        if (report.error) {
            json::JsonObject entry;
            entry.set("filename", json::JsonValue(report.display_name));
            entry.set("error", json::JsonValue(*report.error));
            entries.emplace_back(std::move(entry));
        }
        for (const auto& finding : report.findings) {
            json::JsonObject entry;
            entry.set("filename", json::JsonValue(report.display_name));
            entry.set("line", json::JsonValue(static_cast<int64_t>(finding.location.line)));
            entry.set("column", json::JsonValue(static_cast<int64_t>(finding.location.column) + 1));
            entry.set("code", json::JsonValue(finding.code()));
            entry.set("message", json::JsonValue(finding.message));
            entries.emplace_back(std::move(entry));
        }
    }
    out << json::JsonValue(std::move(entries)).to_string_pretty(2) << "\n";
}

auto exit_code(const std::vector<FileReport>& reports, bool inputs_ok) -> int {
    bool any_error = !inputs_ok;
    bool any_finding = false;
    for (const auto& report : reports) {
        if (report.error) {
            any_error = true;
        }
        if (!report.findings.empty()) {
            any_finding = true;
        }
    }
    if (any_error) {
        return 2;
    }
    return any_finding ? 1 : 0;
}

} // namespace pmc::cli
