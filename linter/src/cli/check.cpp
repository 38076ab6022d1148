//! # Input Discovery and Checking
//!
//! Finds the tree files to check and runs the engine over them.
//!
//! ## Discovery Rules
//!
//! - Files named on the command line are checked whatever their extension
//! - Directories are searched recursively for `*.json`, in sorted order
//!
//! ## Checking Pipeline
//!
//! ```text
//! check_file()
//!   ├─ Read file content
//!   ├─ ast::load_document_text() - JSON text to syntax tree
//!   ├─ RuleEngine::run()         - findings in visit order
//!   └─ RuleSelection::filter()   - drop codes not selected
//! ```

#include "ast/ast_loader.hpp"
#include "cli/cli.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <thread>

namespace pmc::cli {

// ============================================================================
// Discovery
// ============================================================================

namespace {

void find_json_files(const fs::path& dir, std::vector<fs::path>& files) {
    std::vector<fs::path> found;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(
             dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json") {
            found.push_back(it->path());
        }
    }
    if (ec) {
        PMC_LOG_WARN("cli", "Error while scanning " << dir.string() << ": " << ec.message());
    }
    std::sort(found.begin(), found.end());
    files.insert(files.end(), found.begin(), found.end());
}

} // namespace

auto discover_inputs(const std::vector<std::string>& paths, std::vector<fs::path>& files)
    -> bool {
    bool ok = true;
    for (const auto& path : paths) {
        fs::path p(path);
        std::error_code ec;
        if (fs::is_directory(p, ec)) {
            find_json_files(p, files);
        } else if (fs::is_regular_file(p, ec)) {
            files.push_back(p);
        } else {
            PMC_LOG_ERROR("cli", path << " does not exist");
            ok = false;
        }
    }
    return ok;
}

// ============================================================================
// Checking
// ============================================================================

auto check_text(std::string_view text, const std::string& fallback_name,
                const engine::RuleEngine& engine, const RuleSelection& selection) -> FileReport {
    FileReport report;
    report.display_name = fallback_name;

    auto document = ast::load_document_text(text);
    if (is_err(document)) {
        report.error = unwrap_err(document).to_string();
        return report;
    }

    auto& doc = unwrap(document);
    if (!doc.filename.empty()) {
        report.display_name = doc.filename;
    }

    auto findings = engine.run(*doc.tree);
    if (is_err(findings)) {
        report.error = unwrap_err(findings).to_string();
        return report;
    }

    report.findings = selection.filter(std::move(unwrap(findings)));
    return report;
}

auto check_file(const fs::path& path, const engine::RuleEngine& engine,
                const RuleSelection& selection) -> FileReport {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        FileReport report;
        report.display_name = path.string();
        report.error = "cannot open file";
        return report;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    file.close();

    PMC_LOG_DEBUG("cli", "Checking: " << path.string());
    return check_text(content, path.string(), engine, selection);
}

/// Checks files on a pool of worker threads.
///
/// Workers pull the next file through an atomic index and write into the
/// report slot of that file, so the result order does not depend on
/// scheduling.
auto check_files(const std::vector<fs::path>& files, const engine::RuleEngine& engine,
                 const RuleSelection& selection, int jobs) -> std::vector<FileReport> {
    std::vector<FileReport> reports(files.size());
    if (files.empty()) {
        return reports;
    }

    // Determine number of threads
    int num_threads = jobs;
    if (num_threads == 0) {
        num_threads = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads == 0)
            num_threads = 4;
    }

    // Limit threads to number of files
    if (files.size() < static_cast<size_t>(num_threads)) {
        num_threads = static_cast<int>(files.size());
    }

    if (num_threads == 1) {
        for (size_t i = 0; i < files.size(); ++i) {
            reports[i] = check_file(files[i], engine, selection);
        }
        return reports;
    }

    std::atomic<size_t> current_index{0};

    auto worker = [&]() {
        while (true) {
            size_t index = current_index.fetch_add(1);
            if (index >= files.size()) {
                break;
            }
            reports[index] = check_file(files[index], engine, selection);
        }
    };

    PMC_LOG_DEBUG("cli", "Checking " << files.size() << " files on " << num_threads
                                     << " threads");

    std::vector<std::thread> workers;
    for (int i = 0; i < num_threads; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    return reports;
}

} // namespace pmc::cli
