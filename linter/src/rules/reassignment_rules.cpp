//! # Reassignment Rules
//!
//! PMC002 and PMC003 flag a statement that rebinds a name to a call or
//! subscript chained off that same name:
//!
//! ```python
//! df = df.dropna()        # PMC002
//! df = df.loc[df.a > 0]   # PMC003
//! df = clean(df)          # not flagged: `df` is an argument, not the receiver
//! ```

#include "rules/patterns.hpp"
#include "rules/rules.hpp"

namespace pmc::rules {

namespace {

auto is_plain_reassignment_statement(const ast::Node& node) -> bool {
    return node.is<ast::Assign>() || node.is<ast::AnnAssign>();
}

/// Checks whether any plain-name target of `stmt` is named `root->id`.
auto rebinds(const ast::Node& stmt, const ast::Name* root) -> bool {
    if (root == nullptr) {
        return false;
    }
    for (const ast::Node* target : assignment_targets(stmt)) {
        const auto* name = target->get_if<ast::Name>();
        if (name != nullptr && name->id == root->id) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// PMC002
// ============================================================================

auto ReassignmentCallRule::applies_to(const ast::Node& node) const -> bool {
    return is_plain_reassignment_statement(node);
}

auto ReassignmentCallRule::check(const ast::Node& node, const RuleContext& /*context*/) const
    -> bool {
    const ast::Node* value = assignment_value(node);
    if (value == nullptr) {
        return false;
    }
    const auto* call = value->get_if<ast::Call>();
    return call != nullptr && rebinds(node, call_receiver_root(*call));
}

// ============================================================================
// PMC003
// ============================================================================

auto ReassignmentSubscriptRule::applies_to(const ast::Node& node) const -> bool {
    return is_plain_reassignment_statement(node);
}

auto ReassignmentSubscriptRule::check(const ast::Node& node, const RuleContext& /*context*/) const
    -> bool {
    const ast::Node* value = assignment_value(node);
    if (value == nullptr) {
        return false;
    }
    const auto* subscript = value->get_if<ast::Subscript>();
    return subscript != nullptr && rebinds(node, subscript_base_root(*subscript));
}

} // namespace pmc::rules
