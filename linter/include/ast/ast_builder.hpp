//! # Syntax Tree Builder
//!
//! Factory functions that assemble syntax tree nodes. The tree loader builds
//! every node through `make_node`; the named helpers give tests and tools a
//! compact way to spell small Python fragments.
//!
//! ## Example
//!
//! ```cpp
//! using namespace pmc::ast;
//!
//! // df = df.dropna()
//! auto stmt = make_assign(make_name("df", {1, 0}),
//!                         make_method_call(make_name("df", {1, 5}), "dropna", {1, 5}),
//!                         {1, 0});
//! auto module = make_module(node_list(std::move(stmt)));
//! ```

#ifndef PMC_AST_BUILDER_HPP
#define PMC_AST_BUILDER_HPP

#include "ast/ast.hpp"

#include <string>
#include <utility>

namespace pmc::ast {

/// Wraps a kind payload into a heap-allocated node.
template <typename T> [[nodiscard]] auto make_node(T kind, SourceLocation loc) -> NodePtr {
    auto node = make_box<Node>();
    node->kind = std::move(kind);
    node->loc = loc;
    return node;
}

/// Collects move-only nodes into a `NodeList`.
template <typename... Ts> [[nodiscard]] auto node_list(Ts&&... nodes) -> NodeList {
    NodeList list;
    list.reserve(sizeof...(Ts));
    (list.push_back(std::forward<Ts>(nodes)), ...);
    return list;
}

// ============================================================================
// Scopes
// ============================================================================

[[nodiscard]] auto make_module(NodeList body) -> NodePtr;
[[nodiscard]] auto make_function_def(std::string name, NodeList children, SourceLocation loc)
    -> NodePtr;
[[nodiscard]] auto make_class_def(std::string name, NodeList children, SourceLocation loc)
    -> NodePtr;
[[nodiscard]] auto make_lambda(NodeList children, SourceLocation loc) -> NodePtr;

// ============================================================================
// Statements
// ============================================================================

/// `target = value`
[[nodiscard]] auto make_assign(NodePtr target, NodePtr value, SourceLocation loc) -> NodePtr;

/// `t1 = t2 = ... = value`
[[nodiscard]] auto make_assign(NodeList targets, NodePtr value, SourceLocation loc) -> NodePtr;

/// `target: annotation = value` (`value` may be null)
[[nodiscard]] auto make_ann_assign(NodePtr target, NodePtr annotation, NodePtr value,
                                   SourceLocation loc) -> NodePtr;

/// `target op= value`
[[nodiscard]] auto make_aug_assign(NodePtr target, BinaryOperator op, NodePtr value,
                                   SourceLocation loc) -> NodePtr;

/// An expression statement (`Expr` in Python's grammar).
[[nodiscard]] auto make_expr_stmt(NodePtr value) -> NodePtr;

// ============================================================================
// Expressions
// ============================================================================

[[nodiscard]] auto make_name(std::string id, SourceLocation loc) -> NodePtr;
[[nodiscard]] auto make_bool(bool value, SourceLocation loc) -> NodePtr;
[[nodiscard]] auto make_none(SourceLocation loc) -> NodePtr;
[[nodiscard]] auto make_int(int64_t value, SourceLocation loc) -> NodePtr;
[[nodiscard]] auto make_string(std::string value, SourceLocation loc) -> NodePtr;

[[nodiscard]] auto make_attribute(NodePtr value, std::string attr, SourceLocation loc) -> NodePtr;
[[nodiscard]] auto make_subscript(NodePtr value, NodePtr slice, SourceLocation loc) -> NodePtr;

[[nodiscard]] auto make_call(NodePtr func, NodeList args, NodeList keywords, SourceLocation loc)
    -> NodePtr;

/// `receiver.method(args..., keywords...)`; the call and the attribute share
/// the receiver's location, as in Python's tree.
[[nodiscard]] auto make_method_call(NodePtr receiver, std::string method, SourceLocation loc,
                                    NodeList args = {}, NodeList keywords = {}) -> NodePtr;

[[nodiscard]] auto make_keyword(std::string arg, NodePtr value, SourceLocation loc) -> NodePtr;

/// `left op right` as a single-operator comparison.
[[nodiscard]] auto make_compare(NodePtr left, CmpOperator op, NodePtr right, SourceLocation loc)
    -> NodePtr;

[[nodiscard]] auto make_bool_op(BoolOperator op, NodeList values, SourceLocation loc) -> NodePtr;
[[nodiscard]] auto make_bin_op(NodePtr left, BinaryOperator op, NodePtr right, SourceLocation loc)
    -> NodePtr;
[[nodiscard]] auto make_unary_op(UnaryOperator op, NodePtr operand, SourceLocation loc) -> NodePtr;
[[nodiscard]] auto make_tuple(NodeList elts, SourceLocation loc) -> NodePtr;

/// Any other node kind, identified by its Python class name.
[[nodiscard]] auto make_other(std::string type_name, NodeList children, SourceLocation loc = {})
    -> NodePtr;

} // namespace pmc::ast

#endif // PMC_AST_BUILDER_HPP
