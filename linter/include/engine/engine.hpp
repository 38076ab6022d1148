//! # Rule Engine
//!
//! Walks a syntax tree once and collects the findings of a fixed rule list.
//!
//! ## Traversal
//!
//! - Pre-order, in source order; every node is visited exactly once
//! - At each node the rules run in list order; a rule whose `yields_to`
//!   rule already matched the node is skipped, and no rule reports twice
//!   for one node
//! - `Assign`, `AnnAssign` (with a value) and `AugAssign` record their
//!   plain-name targets in the scope's `RuleContext` after their children
//!   have been visited
//! - `FunctionDef`, `ClassDef` and `Lambda` get a fresh `RuleContext` for
//!   their subtree
//!
//! ## Errors
//!
//! A node missing a required part (an `Assign` without a value, a `Call`
//! without a callee, a reportable node without a position) stops the run
//! with an `EngineError`, as does nesting deeper than `ast::MAX_TREE_DEPTH`.
//! Nodes that simply do not match are not errors.
//!
//! ## Thread Safety
//!
//! `run` is `const` and keeps its state on the stack, so one engine can
//! check many trees concurrently.

#ifndef PMC_ENGINE_HPP
#define PMC_ENGINE_HPP

#include "ast/ast.hpp"
#include "common.hpp"
#include "rules/finding.hpp"
#include "rules/rule.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pmc::engine {

/// A malformed node found during a run.
struct EngineError {
    /// Kind name of the malformed node.
    std::string node_kind;

    /// The missing or inconsistent part (`"value"`, `"targets"`, ...).
    std::string role;

    /// What is wrong with it.
    std::string reason;

    /// Position of the malformed node, if it has one.
    SourceLocation location;

    /// Formats as `malformed Assign node at 3:0: missing required 'value'`.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Checks the parts of `node` the rules rely on. Children are not checked.
[[nodiscard]] auto validate_node(const ast::Node& node) -> std::optional<EngineError>;

/// Runs a rule list over syntax trees.
class RuleEngine {
public:
    explicit RuleEngine(std::vector<Box<rules::Rule>> rules);

    /// Engine running `rules::default_rules()`.
    [[nodiscard]] static auto with_default_rules() -> RuleEngine;

    /// Checks one tree. Findings are in visit order.
    [[nodiscard]] auto run(const ast::Node& root) const
        -> Result<std::vector<rules::Finding>, EngineError>;

    [[nodiscard]] auto rules() const -> const std::vector<Box<rules::Rule>>& {
        return rules_;
    }

private:
    std::vector<Box<rules::Rule>> rules_;
};

} // namespace pmc::engine

#endif // PMC_ENGINE_HPP
