//! # Checker Driver
//!
//! Entry point behind `main()`: sets up logging, reads options, checks the
//! inputs and reports.

#include "cli/driver.hpp"

#include "cli/cli.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace pmc;
using namespace pmc::cli;

int pmc_main(int argc, char* argv[]) {
    pmc::log::Logger::init(pmc::log::parse_log_options(argc, argv));

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_command_line(args);
    if (is_err(parsed)) {
        PMC_LOG_ERROR("cli", unwrap_err(parsed));
        std::cerr << "Run 'pmc-lint --help' for usage.\n";
        return 2;
    }

    const auto& cmd = unwrap(parsed);
    if (cmd.show_help) {
        print_help();
        return 0;
    }
    if (cmd.show_version) {
        print_version();
        return 0;
    }

    const CheckOptions& options = cmd.options;
    RuleSelection selection(options);
    if (selection.selected_count() == 0) {
        PMC_LOG_INFO("cli", "All PMC rules are ignored; use --annoy or --select to enable them");
    }

    std::vector<fs::path> files;
    bool inputs_ok = discover_inputs(options.paths, files);
    if (files.empty()) {
        PMC_LOG_INFO("cli", "No input files found");
    }

    auto rule_engine = engine::RuleEngine::with_default_rules();
    auto reports = check_files(files, rule_engine, selection, options.jobs);

    size_t finding_count = 0;
    for (const auto& report : reports) {
        if (report.error) {
            PMC_LOG_ERROR("cli", report.display_name << ": " << *report.error);
        }
        finding_count += report.findings.size();
    }

    if (options.format == OutputFormat::Json) {
        write_json_report(std::cout, reports);
    } else {
        bool color = options.color && isatty(STDOUT_FILENO) != 0;
        write_text_report(std::cout, reports, color);
    }
    std::cout.flush();

    PMC_LOG_INFO("cli", "Checked " << reports.size() << " files, " << finding_count
                                   << " findings");
    pmc::log::Logger::instance().flush();

    return exit_code(reports, inputs_ok);
}
