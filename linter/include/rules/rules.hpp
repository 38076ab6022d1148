//! # Method-Chaining Rules
//!
//! The seven rules and the list the engine runs by default.
//!
//! | Code | Rule | Node |
//! |------|------|------|
//! | PMC001 | `InplaceRule` | `Call` |
//! | PMC002 | `ReassignmentCallRule` | `Assign`, `AnnAssign` |
//! | PMC003 | `ReassignmentSubscriptRule` | `Assign`, `AnnAssign` |
//! | PMC004 | `AssignmentSubscriptRule` | `Assign`, `AugAssign`, `AnnAssign` |
//! | PMC005 | `AssignmentAttributeRule` | `Assign`, `AugAssign`, `AnnAssign` |
//! | PMC006 | `AssignmentIndexColumnsRule` | `Assign`, `AugAssign`, `AnnAssign` |
//! | PMC007 | `SelectionRule` | `Subscript` |

#ifndef PMC_RULES_RULES_HPP
#define PMC_RULES_RULES_HPP

#include "rules/rule.hpp"

#include <vector>

namespace pmc::rules {

/// PMC001: `df.method(inplace=True)`.
class InplaceRule : public Rule {
public:
    [[nodiscard]] auto id() const -> RuleId override {
        return RuleId::InplaceTrue;
    }
    [[nodiscard]] auto applies_to(const ast::Node& node) const -> bool override;
    [[nodiscard]] auto check(const ast::Node& node, const RuleContext& context) const
        -> bool override;
};

/// PMC002: `df = df.method()`; the target name is the call's receiver.
class ReassignmentCallRule : public Rule {
public:
    [[nodiscard]] auto id() const -> RuleId override {
        return RuleId::ReassignmentCall;
    }
    [[nodiscard]] auto applies_to(const ast::Node& node) const -> bool override;
    [[nodiscard]] auto check(const ast::Node& node, const RuleContext& context) const
        -> bool override;
};

/// PMC003: `df = df[...]`; the target name is the subscript's base.
class ReassignmentSubscriptRule : public Rule {
public:
    [[nodiscard]] auto id() const -> RuleId override {
        return RuleId::ReassignmentSubscript;
    }
    [[nodiscard]] auto applies_to(const ast::Node& node) const -> bool override;
    [[nodiscard]] auto check(const ast::Node& node, const RuleContext& context) const
        -> bool override;
};

/// PMC004: `df["col"] = value`.
class AssignmentSubscriptRule : public Rule {
public:
    [[nodiscard]] auto id() const -> RuleId override {
        return RuleId::AssignmentSubscript;
    }
    [[nodiscard]] auto applies_to(const ast::Node& node) const -> bool override;
    [[nodiscard]] auto check(const ast::Node& node, const RuleContext& context) const
        -> bool override;
};

/// PMC005: `df.col = value`. Matches on shape only, so any attribute
/// assignment fires.
class AssignmentAttributeRule : public Rule {
public:
    [[nodiscard]] auto id() const -> RuleId override {
        return RuleId::AssignmentAttribute;
    }
    [[nodiscard]] auto applies_to(const ast::Node& node) const -> bool override;
    [[nodiscard]] auto check(const ast::Node& node, const RuleContext& context) const
        -> bool override;
    [[nodiscard]] auto yields_to() const -> std::optional<RuleId> override {
        return RuleId::AssignmentIndexColumns;
    }
};

/// PMC006: `df.index = ...` / `df.columns = ...`.
class AssignmentIndexColumnsRule : public Rule {
public:
    [[nodiscard]] auto id() const -> RuleId override {
        return RuleId::AssignmentIndexColumns;
    }
    [[nodiscard]] auto applies_to(const ast::Node& node) const -> bool override;
    [[nodiscard]] auto check(const ast::Node& node, const RuleContext& context) const
        -> bool override;
};

/// PMC007: `df[mask]` where `mask` was bound to a mask expression earlier
/// in the same scope.
class SelectionRule : public Rule {
public:
    [[nodiscard]] auto id() const -> RuleId override {
        return RuleId::SelectionWithoutLambda;
    }
    [[nodiscard]] auto applies_to(const ast::Node& node) const -> bool override;
    [[nodiscard]] auto check(const ast::Node& node, const RuleContext& context) const
        -> bool override;
};

/// Creates a rule by id.
[[nodiscard]] auto make_rule(RuleId id) -> Box<Rule>;

/// The default rule list in evaluation order. PMC006 precedes PMC005 so
/// that it can take priority on the same node.
[[nodiscard]] auto default_rules() -> std::vector<Box<Rule>>;

} // namespace pmc::rules

#endif // PMC_RULES_RULES_HPP
