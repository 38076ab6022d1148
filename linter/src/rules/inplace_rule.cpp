#include "rules/rules.hpp"

namespace pmc::rules {

auto InplaceRule::applies_to(const ast::Node& node) const -> bool {
    return node.is<ast::Call>();
}

auto InplaceRule::check(const ast::Node& node, const RuleContext& /*context*/) const -> bool {
    const auto& call = node.as<ast::Call>();
    for (const auto& kw_node : call.keywords) {
        const auto* kw = kw_node ? kw_node->get_if<ast::Keyword>() : nullptr;
        if (kw == nullptr || kw->arg != "inplace" || !kw->value) {
            continue;
        }
        // Only the literal `True`; a variable or `False` is not flagged.
        const auto* literal = kw->value->get_if<ast::Constant>();
        if (literal != nullptr && literal->is_true()) {
            return true;
        }
    }
    return false;
}

} // namespace pmc::rules
