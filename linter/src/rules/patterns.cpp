#include "rules/patterns.hpp"

#include <array>

namespace pmc::rules {

namespace {

/// pandas methods (and `pd.*` functions) returning boolean Series/frames.
constexpr std::array<std::string_view, 20> MASK_METHODS = {
    "isna",  "isnull",   "notna", "notnull",  "isin",  "between", "duplicated",
    "contains", "startswith", "endswith", "match", "fullmatch", "eq",  "ne",
    "lt",    "le",       "gt",    "ge",       "any",   "all",
};

} // namespace

auto chain_root(const ast::Node& expr) -> const ast::Name* {
    const ast::Node* current = &expr;
    while (current != nullptr) {
        if (const auto* name = current->get_if<ast::Name>()) {
            return name;
        }
        if (const auto* attr = current->get_if<ast::Attribute>()) {
            current = attr->value.get();
        } else if (const auto* call = current->get_if<ast::Call>()) {
            current = call->func.get();
        } else if (const auto* sub = current->get_if<ast::Subscript>()) {
            current = sub->value.get();
        } else {
            return nullptr;
        }
    }
    return nullptr;
}

auto call_receiver_root(const ast::Call& call) -> const ast::Name* {
    if (!call.func) {
        return nullptr;
    }
    const auto* method = call.func->get_if<ast::Attribute>();
    if (method == nullptr || !method->value) {
        return nullptr;
    }
    return chain_root(*method->value);
}

auto subscript_base_root(const ast::Subscript& subscript) -> const ast::Name* {
    if (!subscript.value) {
        return nullptr;
    }
    return chain_root(*subscript.value);
}

auto is_mask_method(std::string_view method) -> bool {
    for (auto name : MASK_METHODS) {
        if (name == method) {
            return true;
        }
    }
    return false;
}

auto is_mask_expression(const ast::Node& expr, const RuleContext& context) -> bool {
    if (expr.is<ast::Compare>()) {
        return true;
    }

    if (const auto* name = expr.get_if<ast::Name>()) {
        return context.is_mask(name->id);
    }

    if (const auto* unary = expr.get_if<ast::UnaryOp>()) {
        if (unary->op != ast::UnaryOperator::Invert && unary->op != ast::UnaryOperator::Not) {
            return false;
        }
        return unary->operand && is_mask_expression(*unary->operand, context);
    }

    if (const auto* bin = expr.get_if<ast::BinOp>()) {
        if (bin->op != ast::BinaryOperator::BitAnd && bin->op != ast::BinaryOperator::BitOr &&
            bin->op != ast::BinaryOperator::BitXor) {
            return false;
        }
        return (bin->left && is_mask_expression(*bin->left, context)) ||
               (bin->right && is_mask_expression(*bin->right, context));
    }

    if (const auto* bool_op = expr.get_if<ast::BoolOp>()) {
        for (const auto& value : bool_op->values) {
            if (value && is_mask_expression(*value, context)) {
                return true;
            }
        }
        return false;
    }

    if (const auto* call = expr.get_if<ast::Call>()) {
        if (!call->func) {
            return false;
        }
        const auto* method = call->func->get_if<ast::Attribute>();
        return method != nullptr && is_mask_method(method->attr);
    }

    return false;
}

auto binding_origins(const ast::Node& value, const RuleContext& context) -> uint8_t {
    if (is_mask_expression(value, context)) {
        return origin_bit(BindingOrigin::Mask);
    }
    return origin_bit(BindingOrigin::Plain);
}

auto assignment_targets(const ast::Node& stmt) -> std::vector<const ast::Node*> {
    std::vector<const ast::Node*> targets;
    if (const auto* assign = stmt.get_if<ast::Assign>()) {
        for (const auto& target : assign->targets) {
            if (target) {
                targets.push_back(target.get());
            }
        }
    } else if (const auto* ann = stmt.get_if<ast::AnnAssign>()) {
        if (ann->target) {
            targets.push_back(ann->target.get());
        }
    } else if (const auto* aug = stmt.get_if<ast::AugAssign>()) {
        if (aug->target) {
            targets.push_back(aug->target.get());
        }
    }
    return targets;
}

auto assignment_value(const ast::Node& stmt) -> const ast::Node* {
    if (const auto* assign = stmt.get_if<ast::Assign>()) {
        return assign->value.get();
    }
    if (const auto* ann = stmt.get_if<ast::AnnAssign>()) {
        return ann->value.get();
    }
    if (const auto* aug = stmt.get_if<ast::AugAssign>()) {
        return aug->value.get();
    }
    return nullptr;
}

} // namespace pmc::rules
