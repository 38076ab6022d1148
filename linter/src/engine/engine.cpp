//! # Rule Engine Implementation

#include "engine/engine.hpp"

#include "log/log.hpp"
#include "rules/patterns.hpp"
#include "rules/rules.hpp"

#include <array>
#include <type_traits>

namespace pmc::engine {

// ============================================================================
// EngineError
// ============================================================================

auto EngineError::to_string() const -> std::string {
    std::string result = "malformed " + node_kind + " node";
    if (location.is_known()) {
        result += " at " + pmc::to_string(location);
    }
    result += ": " + reason;
    return result;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

auto malformed(const ast::Node& node, std::string role, std::string reason) -> EngineError {
    return EngineError{std::string(node.kind_name()), std::move(role), std::move(reason),
                       node.loc};
}

auto missing(const ast::Node& node, const std::string& role) -> EngineError {
    return malformed(node, role, "missing required '" + role + "'");
}

auto has_null(const ast::NodeList& nodes) -> bool {
    for (const auto& node : nodes) {
        if (!node) {
            return true;
        }
    }
    return false;
}

/// Kinds a finding can be reported at.
auto is_reportable(const ast::Node& node) -> bool {
    return node.is<ast::Assign>() || node.is<ast::AnnAssign>() || node.is<ast::AugAssign>() ||
           node.is<ast::Call>() || node.is<ast::Subscript>();
}

} // namespace

auto validate_node(const ast::Node& node) -> std::optional<EngineError> {
    if (is_reportable(node) && !node.loc.is_known()) {
        return missing(node, "lineno");
    }

    return std::visit(
        [&node](const auto& k) -> std::optional<EngineError> {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, ast::Assign>) {
                if (k.targets.empty() || has_null(k.targets))
                    return missing(node, "targets");
                if (!k.value)
                    return missing(node, "value");
            } else if constexpr (std::is_same_v<T, ast::AnnAssign>) {
                if (!k.target)
                    return missing(node, "target");
                if (!k.annotation)
                    return missing(node, "annotation");
            } else if constexpr (std::is_same_v<T, ast::AugAssign>) {
                if (!k.target)
                    return missing(node, "target");
                if (!k.value)
                    return missing(node, "value");
            } else if constexpr (std::is_same_v<T, ast::Call>) {
                if (!k.func)
                    return missing(node, "func");
                if (has_null(k.args))
                    return missing(node, "args");
                for (const auto& kw : k.keywords) {
                    if (!kw || !std::holds_alternative<ast::Keyword>(kw->kind))
                        return malformed(node, "keywords", "keyword list holds a non-keyword node");
                }
            } else if constexpr (std::is_same_v<T, ast::Keyword>) {
                if (!k.value)
                    return missing(node, "value");
            } else if constexpr (std::is_same_v<T, ast::UnaryOp>) {
                if (!k.operand)
                    return missing(node, "operand");
            } else if constexpr (std::is_same_v<T, ast::Attribute>) {
                if (!k.value)
                    return missing(node, "value");
                if (k.attr.empty())
                    return missing(node, "attr");
            } else if constexpr (std::is_same_v<T, ast::Subscript>) {
                if (!k.value)
                    return missing(node, "value");
                if (!k.slice)
                    return missing(node, "slice");
            } else if constexpr (std::is_same_v<T, ast::Name>) {
                if (k.id.empty())
                    return missing(node, "id");
            } else if constexpr (std::is_same_v<T, ast::Compare>) {
                if (!k.left)
                    return missing(node, "left");
                if (k.comparators.empty() || has_null(k.comparators))
                    return missing(node, "comparators");
                if (k.ops.size() != k.comparators.size())
                    return malformed(node, "ops", "operator and comparator counts differ");
            } else if constexpr (std::is_same_v<T, ast::BoolOp>) {
                if (k.values.empty() || has_null(k.values))
                    return missing(node, "values");
            } else if constexpr (std::is_same_v<T, ast::BinOp>) {
                if (!k.left)
                    return missing(node, "left");
                if (!k.right)
                    return missing(node, "right");
            }
            return std::nullopt;
        },
        node.kind);
}

// ============================================================================
// Traversal
// ============================================================================

namespace {

class Walker {
public:
    Walker(const std::vector<Box<rules::Rule>>& rules, std::vector<rules::Finding>& findings)
        : rules_(rules), findings_(findings) {
        scopes_.emplace_back();
    }

    auto visit(const ast::Node& node) -> std::optional<EngineError> {
        if (depth_ >= ast::MAX_TREE_DEPTH) {
            return malformed(node, "depth",
                             "nesting deeper than " + std::to_string(ast::MAX_TREE_DEPTH) +
                                 " levels");
        }
        if (auto error = validate_node(node)) {
            return error;
        }
        ++visited_;

        apply_rules(node);

        bool scoped = node.opens_scope();
        if (scoped) {
            PMC_LOG_TRACE("engine", "Entering " << node.kind_name() << " scope at "
                                                << to_string(node.loc));
            scopes_.emplace_back();
        }

        ++depth_;
        for (const ast::Node* child : ast::children(node)) {
            if (auto error = visit(*child)) {
                return error;
            }
        }
        --depth_;

        if (scoped) {
            scopes_.pop_back();
        }

        record_bindings(node);
        return std::nullopt;
    }

    [[nodiscard]] auto visited() const -> size_t {
        return visited_;
    }

private:
    const std::vector<Box<rules::Rule>>& rules_;
    std::vector<rules::Finding>& findings_;
    std::vector<rules::RuleContext> scopes_;
    size_t visited_ = 0;
    size_t depth_ = 0;

    static auto index(rules::RuleId id) -> size_t {
        return static_cast<size_t>(id);
    }

    void apply_rules(const ast::Node& node) {
        std::array<bool, rules::RULE_COUNT> matched{};
        const rules::RuleContext& context = scopes_.back();

        for (const auto& rule : rules_) {
            rules::RuleId id = rule->id();
            if (matched[index(id)] || !rule->applies_to(node)) {
                continue;
            }
            if (auto prior = rule->yields_to(); prior && matched[index(*prior)]) {
                continue;
            }
            if (rule->check(node, context)) {
                matched[index(id)] = true;
                findings_.push_back(rules::make_finding(id, node.loc));
                PMC_LOG_TRACE("engine", rules::rule_code(id) << " at " << to_string(node.loc));
            }
        }
    }

    void record_bindings(const ast::Node& node) {
        const ast::Node* value = rules::assignment_value(node);
        if (value == nullptr) {
            return;
        }
        rules::RuleContext& context = scopes_.back();
        uint8_t origins = rules::binding_origins(*value, context);
        for (const ast::Node* target : rules::assignment_targets(node)) {
            if (const auto* name = target->get_if<ast::Name>()) {
                context.bind(name->id, origins);
            }
        }
    }
};

} // namespace

// ============================================================================
// RuleEngine
// ============================================================================

RuleEngine::RuleEngine(std::vector<Box<rules::Rule>> rules) : rules_(std::move(rules)) {}

auto RuleEngine::with_default_rules() -> RuleEngine {
    return RuleEngine(rules::default_rules());
}

auto RuleEngine::run(const ast::Node& root) const
    -> Result<std::vector<rules::Finding>, EngineError> {
    std::vector<rules::Finding> findings;
    Walker walker(rules_, findings);

    if (auto error = walker.visit(root)) {
        PMC_LOG_DEBUG("engine", "Run aborted: " << error->to_string());
        return *error;
    }

    PMC_LOG_DEBUG("engine",
                  "Visited " << walker.visited() << " nodes, " << findings.size() << " findings");
    return findings;
}

} // namespace pmc::engine
