#include "ast/ast_builder.hpp"

namespace pmc::ast {

auto make_module(NodeList body) -> NodePtr {
    return make_node(Module{std::move(body)}, SourceLocation{});
}

auto make_function_def(std::string name, NodeList children, SourceLocation loc) -> NodePtr {
    return make_node(FunctionDef{std::move(name), false, std::move(children)}, loc);
}

auto make_class_def(std::string name, NodeList children, SourceLocation loc) -> NodePtr {
    return make_node(ClassDef{std::move(name), std::move(children)}, loc);
}

auto make_lambda(NodeList children, SourceLocation loc) -> NodePtr {
    return make_node(Lambda{std::move(children)}, loc);
}

auto make_assign(NodePtr target, NodePtr value, SourceLocation loc) -> NodePtr {
    return make_assign(node_list(std::move(target)), std::move(value), loc);
}

auto make_assign(NodeList targets, NodePtr value, SourceLocation loc) -> NodePtr {
    return make_node(Assign{std::move(targets), std::move(value)}, loc);
}

auto make_ann_assign(NodePtr target, NodePtr annotation, NodePtr value, SourceLocation loc)
    -> NodePtr {
    return make_node(AnnAssign{std::move(target), std::move(annotation), std::move(value)}, loc);
}

auto make_aug_assign(NodePtr target, BinaryOperator op, NodePtr value, SourceLocation loc)
    -> NodePtr {
    return make_node(AugAssign{std::move(target), op, std::move(value)}, loc);
}

auto make_expr_stmt(NodePtr value) -> NodePtr {
    SourceLocation loc = value ? value->loc : SourceLocation{};
    return make_node(Other{"Expr", node_list(std::move(value))}, loc);
}

auto make_name(std::string id, SourceLocation loc) -> NodePtr {
    return make_node(Name{std::move(id)}, loc);
}

auto make_bool(bool value, SourceLocation loc) -> NodePtr {
    return make_node(Constant{ConstantKind::Bool, value ? "True" : "False"}, loc);
}

auto make_none(SourceLocation loc) -> NodePtr {
    return make_node(Constant{ConstantKind::None, "None"}, loc);
}

auto make_int(int64_t value, SourceLocation loc) -> NodePtr {
    return make_node(Constant{ConstantKind::Int, std::to_string(value)}, loc);
}

auto make_string(std::string value, SourceLocation loc) -> NodePtr {
    return make_node(Constant{ConstantKind::String, std::move(value)}, loc);
}

auto make_attribute(NodePtr value, std::string attr, SourceLocation loc) -> NodePtr {
    return make_node(Attribute{std::move(value), std::move(attr)}, loc);
}

auto make_subscript(NodePtr value, NodePtr slice, SourceLocation loc) -> NodePtr {
    return make_node(Subscript{std::move(value), std::move(slice)}, loc);
}

auto make_call(NodePtr func, NodeList args, NodeList keywords, SourceLocation loc) -> NodePtr {
    return make_node(Call{std::move(func), std::move(args), std::move(keywords)}, loc);
}

auto make_method_call(NodePtr receiver, std::string method, SourceLocation loc, NodeList args,
                      NodeList keywords) -> NodePtr {
    auto func = make_attribute(std::move(receiver), std::move(method), loc);
    return make_call(std::move(func), std::move(args), std::move(keywords), loc);
}

auto make_keyword(std::string arg, NodePtr value, SourceLocation loc) -> NodePtr {
    return make_node(Keyword{std::move(arg), std::move(value)}, loc);
}

auto make_compare(NodePtr left, CmpOperator op, NodePtr right, SourceLocation loc) -> NodePtr {
    Compare cmp;
    cmp.left = std::move(left);
    cmp.ops.push_back(op);
    cmp.comparators.push_back(std::move(right));
    return make_node(std::move(cmp), loc);
}

auto make_bool_op(BoolOperator op, NodeList values, SourceLocation loc) -> NodePtr {
    return make_node(BoolOp{op, std::move(values)}, loc);
}

auto make_bin_op(NodePtr left, BinaryOperator op, NodePtr right, SourceLocation loc) -> NodePtr {
    return make_node(BinOp{std::move(left), op, std::move(right)}, loc);
}

auto make_unary_op(UnaryOperator op, NodePtr operand, SourceLocation loc) -> NodePtr {
    return make_node(UnaryOp{op, std::move(operand)}, loc);
}

auto make_tuple(NodeList elts, SourceLocation loc) -> NodePtr {
    return make_node(Tuple{std::move(elts)}, loc);
}

auto make_other(std::string type_name, NodeList children, SourceLocation loc) -> NodePtr {
    return make_node(Other{std::move(type_name), std::move(children)}, loc);
}

} // namespace pmc::ast
