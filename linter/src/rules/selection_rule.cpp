#include "rules/rules.hpp"

namespace pmc::rules {

namespace {

/// Name used as a selection key: `df[m]`, or the row part of `df.loc[m, "a"]`.
auto key_name(const ast::Node& key) -> const ast::Name* {
    if (const auto* name = key.get_if<ast::Name>()) {
        return name;
    }
    if (const auto* tuple = key.get_if<ast::Tuple>()) {
        if (!tuple->elts.empty() && tuple->elts.front()) {
            return tuple->elts.front()->get_if<ast::Name>();
        }
    }
    return nullptr;
}

} // namespace

auto SelectionRule::applies_to(const ast::Node& node) const -> bool {
    return node.is<ast::Subscript>();
}

auto SelectionRule::check(const ast::Node& node, const RuleContext& context) const -> bool {
    const auto& subscript = node.as<ast::Subscript>();
    if (!subscript.slice) {
        return false;
    }
    const auto* name = key_name(*subscript.slice);
    return name != nullptr && context.is_mask(name->id);
}

} // namespace pmc::rules
