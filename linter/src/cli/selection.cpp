//! # Rule Selection
//!
//! Every PMC rule is ignored unless the user opts in, either with `--annoy`
//! (all rules) or with `--select` (by code prefix).

#include "cli/cli.hpp"

namespace pmc::cli {

namespace {

auto matches_any(std::string_view code, const std::vector<std::string>& prefixes) -> bool {
    for (const auto& prefix : prefixes) {
        if (code.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

} // namespace

RuleSelection::RuleSelection(bool annoy, std::vector<std::string> select,
                             std::vector<std::string> ignore)
    : annoy_(annoy), select_(std::move(select)), ignore_(std::move(ignore)) {}

auto RuleSelection::is_selected(std::string_view code) const -> bool {
    if (matches_any(code, ignore_)) {
        return false;
    }
    if (!select_.empty()) {
        return matches_any(code, select_);
    }
    return annoy_;
}

auto RuleSelection::selected_count() const -> size_t {
    size_t count = 0;
    for (rules::RuleId id : rules::ALL_RULES) {
        if (is_selected(rules::rule_code(id))) {
            ++count;
        }
    }
    return count;
}

auto RuleSelection::filter(std::vector<rules::Finding> findings) const
    -> std::vector<rules::Finding> {
    std::vector<rules::Finding> kept;
    kept.reserve(findings.size());
    for (auto& finding : findings) {
        if (is_selected(finding.code())) {
            kept.push_back(std::move(finding));
        }
    }
    return kept;
}

} // namespace pmc::cli
