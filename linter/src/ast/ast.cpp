//! # Syntax Tree Model Implementation
//!
//! Kind names, operator name tables and child enumeration.

#include "ast/ast.hpp"

#include <array>
#include <type_traits>
#include <utility>

namespace pmc::ast {

// ============================================================================
// Operator Names
// ============================================================================

namespace {

template <typename E, size_t N>
auto lookup(const std::array<std::pair<std::string_view, E>, N>& table, std::string_view name,
            E fallback) -> E {
    for (const auto& [text, value] : table) {
        if (text == name) {
            return value;
        }
    }
    return fallback;
}

constexpr std::array<std::pair<std::string_view, BinaryOperator>, 13> BINARY_OPS = {{
    {"Add", BinaryOperator::Add},
    {"Sub", BinaryOperator::Sub},
    {"Mult", BinaryOperator::Mult},
    {"MatMult", BinaryOperator::MatMult},
    {"Div", BinaryOperator::Div},
    {"Mod", BinaryOperator::Mod},
    {"Pow", BinaryOperator::Pow},
    {"LShift", BinaryOperator::LShift},
    {"RShift", BinaryOperator::RShift},
    {"BitOr", BinaryOperator::BitOr},
    {"BitXor", BinaryOperator::BitXor},
    {"BitAnd", BinaryOperator::BitAnd},
    {"FloorDiv", BinaryOperator::FloorDiv},
}};

constexpr std::array<std::pair<std::string_view, UnaryOperator>, 4> UNARY_OPS = {{
    {"Invert", UnaryOperator::Invert},
    {"Not", UnaryOperator::Not},
    {"UAdd", UnaryOperator::UAdd},
    {"USub", UnaryOperator::USub},
}};

constexpr std::array<std::pair<std::string_view, BoolOperator>, 2> BOOL_OPS = {{
    {"And", BoolOperator::And},
    {"Or", BoolOperator::Or},
}};

constexpr std::array<std::pair<std::string_view, CmpOperator>, 10> CMP_OPS = {{
    {"Eq", CmpOperator::Eq},
    {"NotEq", CmpOperator::NotEq},
    {"Lt", CmpOperator::Lt},
    {"LtE", CmpOperator::LtE},
    {"Gt", CmpOperator::Gt},
    {"GtE", CmpOperator::GtE},
    {"Is", CmpOperator::Is},
    {"IsNot", CmpOperator::IsNot},
    {"In", CmpOperator::In},
    {"NotIn", CmpOperator::NotIn},
}};

void push(std::vector<const Node*>& out, const NodePtr& node) {
    if (node) {
        out.push_back(node.get());
    }
}

void push_all(std::vector<const Node*>& out, const NodeList& nodes) {
    for (const auto& node : nodes) {
        push(out, node);
    }
}

} // namespace

auto binary_operator_from_name(std::string_view name) -> BinaryOperator {
    return lookup(BINARY_OPS, name, BinaryOperator::Unknown);
}

auto unary_operator_from_name(std::string_view name) -> UnaryOperator {
    return lookup(UNARY_OPS, name, UnaryOperator::Unknown);
}

auto bool_operator_from_name(std::string_view name) -> BoolOperator {
    return lookup(BOOL_OPS, name, BoolOperator::Unknown);
}

auto cmp_operator_from_name(std::string_view name) -> CmpOperator {
    return lookup(CMP_OPS, name, CmpOperator::Unknown);
}

// ============================================================================
// Node
// ============================================================================

auto Node::kind_name() const -> std::string_view {
    return std::visit(
        [](const auto& k) -> std::string_view {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, Module>)
                return "Module";
            else if constexpr (std::is_same_v<T, FunctionDef>)
                return k.is_async ? "AsyncFunctionDef" : "FunctionDef";
            else if constexpr (std::is_same_v<T, ClassDef>)
                return "ClassDef";
            else if constexpr (std::is_same_v<T, Lambda>)
                return "Lambda";
            else if constexpr (std::is_same_v<T, Assign>)
                return "Assign";
            else if constexpr (std::is_same_v<T, AnnAssign>)
                return "AnnAssign";
            else if constexpr (std::is_same_v<T, AugAssign>)
                return "AugAssign";
            else if constexpr (std::is_same_v<T, Call>)
                return "Call";
            else if constexpr (std::is_same_v<T, Keyword>)
                return "keyword";
            else if constexpr (std::is_same_v<T, Attribute>)
                return "Attribute";
            else if constexpr (std::is_same_v<T, Subscript>)
                return "Subscript";
            else if constexpr (std::is_same_v<T, Name>)
                return "Name";
            else if constexpr (std::is_same_v<T, Constant>)
                return "Constant";
            else if constexpr (std::is_same_v<T, Compare>)
                return "Compare";
            else if constexpr (std::is_same_v<T, BoolOp>)
                return "BoolOp";
            else if constexpr (std::is_same_v<T, BinOp>)
                return "BinOp";
            else if constexpr (std::is_same_v<T, UnaryOp>)
                return "UnaryOp";
            else if constexpr (std::is_same_v<T, Tuple>)
                return "Tuple";
            else
                return k.type_name;
        },
        kind);
}

auto children(const Node& node) -> std::vector<const Node*> {
    std::vector<const Node*> out;
    std::visit(
        [&out](const auto& k) {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, Module>) {
                push_all(out, k.body);
            } else if constexpr (std::is_same_v<T, FunctionDef> || std::is_same_v<T, ClassDef> ||
                                 std::is_same_v<T, Lambda> || std::is_same_v<T, Other>) {
                push_all(out, k.children);
            } else if constexpr (std::is_same_v<T, Assign>) {
                push_all(out, k.targets);
                push(out, k.value);
            } else if constexpr (std::is_same_v<T, AnnAssign>) {
                push(out, k.target);
                push(out, k.annotation);
                push(out, k.value);
            } else if constexpr (std::is_same_v<T, AugAssign>) {
                push(out, k.target);
                push(out, k.value);
            } else if constexpr (std::is_same_v<T, Call>) {
                push(out, k.func);
                push_all(out, k.args);
                push_all(out, k.keywords);
            } else if constexpr (std::is_same_v<T, Keyword> || std::is_same_v<T, Attribute>) {
                push(out, k.value);
            } else if constexpr (std::is_same_v<T, Subscript>) {
                push(out, k.value);
                push(out, k.slice);
            } else if constexpr (std::is_same_v<T, Compare>) {
                push(out, k.left);
                push_all(out, k.comparators);
            } else if constexpr (std::is_same_v<T, BoolOp>) {
                push_all(out, k.values);
            } else if constexpr (std::is_same_v<T, BinOp>) {
                push(out, k.left);
                push(out, k.right);
            } else if constexpr (std::is_same_v<T, UnaryOp>) {
                push(out, k.operand);
            } else if constexpr (std::is_same_v<T, Tuple>) {
                push_all(out, k.elts);
            }
            // Name and Constant are leaves.
        },
        node.kind);
    return out;
}

auto count_nodes(const Node& node) -> size_t {
    size_t total = 1;
    for (const Node* child : children(node)) {
        total += count_nodes(*child);
    }
    return total;
}

} // namespace pmc::ast
