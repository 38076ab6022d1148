//! # Findings
//!
//! Rule identifiers, their stable codes and messages, and the `Finding`
//! record the engine produces.

#ifndef PMC_RULES_FINDING_HPP
#define PMC_RULES_FINDING_HPP

#include "common.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pmc::rules {

/// The seven method-chaining rules.
enum class RuleId : uint8_t {
    InplaceTrue = 0,             ///< PMC001
    ReassignmentCall = 1,        ///< PMC002
    ReassignmentSubscript = 2,   ///< PMC003
    AssignmentSubscript = 3,     ///< PMC004
    AssignmentAttribute = 4,     ///< PMC005
    AssignmentIndexColumns = 5,  ///< PMC006
    SelectionWithoutLambda = 6,  ///< PMC007
};

/// Number of rules.
constexpr size_t RULE_COUNT = 7;

/// All rule ids in code order.
constexpr std::array<RuleId, RULE_COUNT> ALL_RULES = {
    RuleId::InplaceTrue,           RuleId::ReassignmentCall,       RuleId::ReassignmentSubscript,
    RuleId::AssignmentSubscript,   RuleId::AssignmentAttribute,    RuleId::AssignmentIndexColumns,
    RuleId::SelectionWithoutLambda,
};

/// Stable code of a rule, e.g. `"PMC001"`.
[[nodiscard]] auto rule_code(RuleId id) -> const char*;

/// Fixed message text of a rule, without the code.
[[nodiscard]] auto rule_message(RuleId id) -> const char*;

/// Looks up a rule by its exact code.
[[nodiscard]] auto rule_from_code(std::string_view code) -> std::optional<RuleId>;

/// A rule match at a node of the inspected tree.
struct Finding {
    RuleId rule;
    std::string message;
    SourceLocation location; ///< Copied from the triggering node.

    [[nodiscard]] auto code() const -> const char* {
        return rule_code(rule);
    }

    [[nodiscard]] auto operator==(const Finding& other) const -> bool = default;
};

/// Creates the finding of `rule` at `location`.
[[nodiscard]] inline auto make_finding(RuleId rule, SourceLocation location) -> Finding {
    return Finding{rule, rule_message(rule), location};
}

} // namespace pmc::rules

#endif // PMC_RULES_FINDING_HPP
