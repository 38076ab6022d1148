//! # Rule Interface
//!
//! A rule is a stateless predicate over one syntax node. The engine offers
//! every visited node to every rule whose `applies_to` accepts it, together
//! with the `RuleContext` of the enclosing scope.
//!
//! ## Rule Context
//!
//! Rules that look across statements (a mask computed in one statement and
//! used in a later one) do not keep state of their own. The engine records
//! each plain-name binding in the scope's `RuleContext` once the binding
//! statement has been fully visited, and rules query it.
//!
//! ```python
//! mask = df.a > 0   # binds `mask` with origin Mask
//! df[mask]          # PMC007 sees `mask` as a tracked mask
//! ```

#ifndef PMC_RULES_RULE_HPP
#define PMC_RULES_RULE_HPP

#include "ast/ast.hpp"
#include "rules/finding.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pmc::rules {

// ============================================================================
// RuleContext
// ============================================================================

/// How a name was bound. Rebinding a name merges the origins.
enum class BindingOrigin : uint8_t {
    Plain = 0,
    Mask = 1 << 0, ///< `x = df.a > 0`
};

/// Names bound so far in one scope and how they were bound.
///
/// The context only grows: rebinding a name adds origins, it never removes
/// any.
class RuleContext {
public:
    /// Records a binding of `name` with the given origin bits.
    void bind(const std::string& name, uint8_t origins);

    /// Checks whether `name` was ever bound with `origin`.
    [[nodiscard]] auto has_origin(std::string_view name, BindingOrigin origin) const -> bool;

    [[nodiscard]] auto is_mask(std::string_view name) const -> bool {
        return has_origin(name, BindingOrigin::Mask);
    }

    [[nodiscard]] auto size() const -> size_t {
        return names_.size();
    }

private:
    std::unordered_map<std::string, uint8_t> names_;
};

/// Bit value of an origin, for combining into a mask.
constexpr auto origin_bit(BindingOrigin origin) -> uint8_t {
    return static_cast<uint8_t>(origin);
}

// ============================================================================
// Rule
// ============================================================================

/// Abstract base class for all rules.
class Rule {
public:
    virtual ~Rule() = default;

    [[nodiscard]] virtual auto id() const -> RuleId = 0;

    /// Kind filter: returns `true` if the node's kind can ever match.
    [[nodiscard]] virtual auto applies_to(const ast::Node& node) const -> bool = 0;

    /// Evaluates the rule on a node accepted by `applies_to`.
    [[nodiscard]] virtual auto check(const ast::Node& node, const RuleContext& context) const
        -> bool = 0;

    /// A rule that takes priority on the same node. When it has already
    /// matched, this rule is not evaluated.
    [[nodiscard]] virtual auto yields_to() const -> std::optional<RuleId> {
        return std::nullopt;
    }
};

} // namespace pmc::rules

#endif // PMC_RULES_RULE_HPP
