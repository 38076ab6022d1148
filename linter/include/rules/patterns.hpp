//! # Shared Tree Patterns
//!
//! Small matchers over expressions that several rules (and the engine's
//! binding bookkeeping) share.

#ifndef PMC_RULES_PATTERNS_HPP
#define PMC_RULES_PATTERNS_HPP

#include "ast/ast.hpp"
#include "rules/rule.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace pmc::rules {

/// Follows `value`/`func` links down an access chain (`x.a().b[...]`) and
/// returns the root name, or `nullptr` if the chain starts with anything
/// other than a plain name.
[[nodiscard]] auto chain_root(const ast::Node& expr) -> const ast::Name*;

/// Receiver root of a method call: for `x.a().b()` this is `x`. Returns
/// `nullptr` for calls that are not method calls (`f(x)`).
[[nodiscard]] auto call_receiver_root(const ast::Call& call) -> const ast::Name*;

/// Base root of a subscript: `x` for `x[...]`, `x.loc[...]` and
/// `x.a()[...]`.
[[nodiscard]] auto subscript_base_root(const ast::Subscript& subscript) -> const ast::Name*;

/// Checks whether a method name produces a boolean mask (`isna`, `isin`, ...).
[[nodiscard]] auto is_mask_method(std::string_view method) -> bool;

/// Checks whether an expression evaluates to a boolean mask, given the
/// masks already tracked in `context`.
[[nodiscard]] auto is_mask_expression(const ast::Node& expr, const RuleContext& context) -> bool;

/// Origin bits recorded for a name bound to `value`.
[[nodiscard]] auto binding_origins(const ast::Node& value, const RuleContext& context) -> uint8_t;

/// Assignment targets of a binding statement (`Assign`, `AnnAssign`,
/// `AugAssign`); empty for any other node.
[[nodiscard]] auto assignment_targets(const ast::Node& stmt) -> std::vector<const ast::Node*>;

/// Value of a binding statement, or `nullptr` (bare annotation, other node).
[[nodiscard]] auto assignment_value(const ast::Node& stmt) -> const ast::Node*;

} // namespace pmc::rules

#endif // PMC_RULES_PATTERNS_HPP
