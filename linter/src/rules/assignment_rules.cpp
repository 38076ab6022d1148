//! # Assignment Rules
//!
//! PMC004, PMC005 and PMC006 look only at the shape of the assignment
//! targets. A bare annotation (`df.x: int`) assigns nothing and is skipped.

#include "rules/patterns.hpp"
#include "rules/rules.hpp"

namespace pmc::rules {

namespace {

auto is_assignment_statement(const ast::Node& node) -> bool {
    if (const auto* ann = node.get_if<ast::AnnAssign>()) {
        return ann->value != nullptr;
    }
    return node.is<ast::Assign>() || node.is<ast::AugAssign>();
}

auto is_index_or_columns(const std::string& attr) -> bool {
    return attr == "index" || attr == "columns";
}

} // namespace

// ============================================================================
// PMC004
// ============================================================================

auto AssignmentSubscriptRule::applies_to(const ast::Node& node) const -> bool {
    return is_assignment_statement(node);
}

auto AssignmentSubscriptRule::check(const ast::Node& node, const RuleContext& /*context*/) const
    -> bool {
    for (const ast::Node* target : assignment_targets(node)) {
        if (target->is<ast::Subscript>()) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// PMC005
// ============================================================================

auto AssignmentAttributeRule::applies_to(const ast::Node& node) const -> bool {
    return is_assignment_statement(node);
}

auto AssignmentAttributeRule::check(const ast::Node& node, const RuleContext& /*context*/) const
    -> bool {
    for (const ast::Node* target : assignment_targets(node)) {
        const auto* attr = target->get_if<ast::Attribute>();
        if (attr != nullptr && !is_index_or_columns(attr->attr)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// PMC006
// ============================================================================

auto AssignmentIndexColumnsRule::applies_to(const ast::Node& node) const -> bool {
    return is_assignment_statement(node);
}

auto AssignmentIndexColumnsRule::check(const ast::Node& node,
                                       const RuleContext& /*context*/) const -> bool {
    for (const ast::Node* target : assignment_targets(node)) {
        const auto* attr = target->get_if<ast::Attribute>();
        if (attr != nullptr && is_index_or_columns(attr->attr)) {
            return true;
        }
    }
    return false;
}

} // namespace pmc::rules
