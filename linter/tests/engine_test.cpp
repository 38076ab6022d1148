//! # Rule Engine Tests
//!
//! Whole-tree runs of the default rule list: the reference scenarios,
//! finding order, scope handling, malformed trees and concurrent use.

#include "ast/ast_builder.hpp"
#include "engine/engine.hpp"
#include "rules/rules.hpp"

#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <utility>
#include <vector>

using namespace pmc;
using namespace pmc::ast;
using namespace pmc::engine;
using namespace pmc::rules;

namespace {

auto at(uint32_t line, uint32_t column = 0) -> SourceLocation {
    return SourceLocation{line, column};
}

auto name(const char* id, SourceLocation loc) -> NodePtr {
    return make_name(id, loc);
}

auto attr(NodePtr receiver, const char* attr_name) -> NodePtr {
    SourceLocation loc = receiver->loc;
    return make_attribute(std::move(receiver), attr_name, loc);
}

auto method(NodePtr receiver, const char* method_name, NodeList keywords = {}) -> NodePtr {
    SourceLocation loc = receiver->loc;
    return make_method_call(std::move(receiver), method_name, loc, {}, std::move(keywords));
}

auto subscript(NodePtr base, NodePtr key) -> NodePtr {
    SourceLocation loc = base->loc;
    return make_subscript(std::move(base), std::move(key), loc);
}

/// `<frame>.<column> > 0` on `line`
auto comparison(const char* frame, const char* column, uint32_t line) -> NodePtr {
    return make_compare(attr(name(frame, at(line, 7)), column), CmpOperator::Gt,
                        make_int(0, at(line, 16)), at(line, 7));
}

/// `mask = df.a > 0` on `line`
auto mask_assignment(const char* mask, uint32_t line) -> NodePtr {
    return make_assign(name(mask, at(line)), comparison("df", "a", line), at(line));
}

/// `df[<key>]` as an expression statement on `line`
auto selection(const char* key, uint32_t line) -> NodePtr {
    return make_expr_stmt(subscript(name("df", at(line)), name(key, at(line, 3))));
}

auto function(const char* fn_name, NodeList body, uint32_t line) -> NodePtr {
    NodeList children;
    children.push_back(make_other("arguments", {}));
    for (auto& stmt : body) {
        children.push_back(std::move(stmt));
    }
    return make_function_def(fn_name, std::move(children), at(line));
}

struct Hit {
    const char* code;
    uint32_t line;
    uint32_t column;
};

} // namespace

class RuleEngineTest : public ::testing::Test {
protected:
    RuleEngine engine = RuleEngine::with_default_rules();

    auto run(const Node& root) -> std::vector<Finding> {
        auto result = engine.run(root);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return {};
        }
        return std::move(unwrap(result));
    }

    auto run_module(NodeList body) -> std::vector<Finding> {
        auto module = make_module(std::move(body));
        return run(*module);
    }

    static void expect_hits(const std::vector<Finding>& findings, const std::vector<Hit>& hits) {
        ASSERT_EQ(findings.size(), hits.size());
        for (size_t i = 0; i < hits.size(); ++i) {
            EXPECT_STREQ(findings[i].code(), hits[i].code) << "finding " << i;
            EXPECT_EQ(findings[i].location.line, hits[i].line) << "finding " << i;
            EXPECT_EQ(findings[i].location.column, hits[i].column) << "finding " << i;
        }
    }
};

// ============================================================================
// Reference Scenarios
// ============================================================================

TEST_F(RuleEngineTest, InplaceTrue) {
    // df.dropna(inplace=True)
    auto findings = run_module(node_list(make_expr_stmt(method(
        name("df", at(1)), "dropna",
        node_list(make_keyword("inplace", make_bool(true, at(1, 18)), at(1, 10)))))));

    expect_hits(findings, {{"PMC001", 1, 0}});
    EXPECT_EQ(findings[0].message, "usage of 'inplace=True' should be avoided");
}

TEST_F(RuleEngineTest, ReassignmentCall) {
    // df = df.dropna()
    auto findings = run_module(
        node_list(make_assign(name("df", at(1)), method(name("df", at(1, 5)), "dropna"), at(1))));

    expect_hits(findings, {{"PMC002", 1, 0}});
}

TEST_F(RuleEngineTest, ReassignmentSubscriptWithInlineMask) {
    // df = df[df.a > 0]
    auto findings = run_module(node_list(make_assign(
        name("df", at(1)), subscript(name("df", at(1, 5)), comparison("df", "a", 1)), at(1))));

    expect_hits(findings, {{"PMC003", 1, 0}});
}

TEST_F(RuleEngineTest, AssignmentSubscript) {
    // df['new_col'] = 5
    auto findings = run_module(node_list(
        make_assign(subscript(name("df", at(1)), make_string("new_col", at(1, 3))),
                    make_int(5, at(1, 16)), at(1))));

    expect_hits(findings, {{"PMC004", 1, 0}});
}

TEST_F(RuleEngineTest, AssignmentColumns) {
    // df.columns = ['a', 'b']
    auto labels = make_other(
        "List", node_list(make_string("a", at(1, 14)), make_string("b", at(1, 19))), at(1, 13));
    auto findings = run_module(
        node_list(make_assign(attr(name("df", at(1)), "columns"), std::move(labels), at(1))));

    expect_hits(findings, {{"PMC006", 1, 0}});
}

TEST_F(RuleEngineTest, SelectionWithTrackedMask) {
    // mask = df.a > 0
    // df[mask]
    auto findings = run_module(node_list(mask_assignment("mask", 1), selection("mask", 2)));

    expect_hits(findings, {{"PMC007", 2, 0}});
    EXPECT_EQ(findings[0].message,
              "selection reusing a variable could be performed with a lambda");
}

// ============================================================================
// Ordering and Purity
// ============================================================================

TEST_F(RuleEngineTest, EmptyModule) {
    EXPECT_TRUE(run_module({}).empty());
}

TEST_F(RuleEngineTest, CleanCodeHasNoFindings) {
    // df.assign(col=0).rename(columns=str.lower)
    auto chain = method(
        method(name("df", at(1)), "assign", node_list(make_keyword("col", make_int(0, at(1, 14)),
                                                                   at(1, 10)))),
        "rename", node_list(make_keyword("columns", attr(name("str", at(1, 32)), "lower"),
                                         at(1, 24))));
    EXPECT_TRUE(run_module(node_list(make_expr_stmt(std::move(chain)))).empty());
}

TEST_F(RuleEngineTest, FindingsFollowVisitOrder) {
    // mask = df.a > 0
    // df = df[mask]
    // df.dropna(inplace=True)
    auto findings = run_module(node_list(
        mask_assignment("mask", 1),
        make_assign(name("df", at(2)), subscript(name("df", at(2, 5)), name("mask", at(2, 8))),
                    at(2)),
        make_expr_stmt(method(name("df", at(3)), "dropna",
                              node_list(make_keyword("inplace", make_bool(true, at(3, 18)),
                                                     at(3, 10)))))));

    // The statement is visited before its subscript value.
    expect_hits(findings, {{"PMC003", 2, 0}, {"PMC007", 2, 5}, {"PMC001", 3, 0}});
}

TEST_F(RuleEngineTest, RunIsIdempotent) {
    auto module = make_module(node_list(
        mask_assignment("mask", 1), selection("mask", 2),
        make_assign(name("df", at(3)), method(name("df", at(3, 5)), "dropna"), at(3))));

    auto first = run(*module);
    auto second = run(*module);
    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(first, second);
}

TEST_F(RuleEngineTest, LocationsComeFromVisitedNodes) {
    auto module = make_module(node_list(
        mask_assignment("m", 1), selection("m", 2),
        make_assign(subscript(name("df", at(3, 4)), make_string("a", at(3, 7))),
                    make_int(1, at(3, 14)), at(3, 4)),
        make_assign(attr(name("df", at(4, 8)), "index"), name("labels", at(4, 19)), at(4, 8))));

    std::set<std::pair<uint32_t, uint32_t>> locations;
    std::vector<const Node*> pending{module.get()};
    while (!pending.empty()) {
        const Node* node = pending.back();
        pending.pop_back();
        locations.insert({node->loc.line, node->loc.column});
        for (const Node* child : children(*node)) {
            pending.push_back(child);
        }
    }

    auto findings = run(*module);
    ASSERT_EQ(findings.size(), 3u);
    for (const auto& finding : findings) {
        EXPECT_TRUE(locations.count({finding.location.line, finding.location.column}) == 1)
            << finding.code() << " at " << to_string(finding.location);
    }
}

// ============================================================================
// PMC005 / PMC006
// ============================================================================

TEST_F(RuleEngineTest, IndexAssignmentIsOnlyRename) {
    for (const char* attr_name : {"index", "columns"}) {
        auto findings = run_module(
            node_list(make_assign(attr(name("df", at(1)), attr_name), name("x", at(1, 12)), at(1))));
        expect_hits(findings, {{"PMC006", 1, 0}});
    }
}

TEST_F(RuleEngineTest, OtherAttributeIsOnlyAssign) {
    auto findings = run_module(
        node_list(make_assign(attr(name("df", at(1)), "col"), make_int(0, at(1, 9)), at(1))));
    expect_hits(findings, {{"PMC005", 1, 0}});
}

TEST_F(RuleEngineTest, EachRuleFiresOncePerNode) {
    // df.a = df.b = 0
    auto findings = run_module(node_list(make_assign(
        node_list(attr(name("df", at(1)), "a"), attr(name("df", at(1, 7)), "b")),
        make_int(0, at(1, 14)), at(1))));
    expect_hits(findings, {{"PMC005", 1, 0}});

    // df.a = df.index = 0: the rename rule takes the whole statement
    auto mixed = run_module(node_list(make_assign(
        node_list(attr(name("df", at(1)), "a"), attr(name("df", at(1, 7)), "index")),
        make_int(0, at(1, 18)), at(1))));
    expect_hits(mixed, {{"PMC006", 1, 0}});
}

// ============================================================================
// Scopes and Bindings
// ============================================================================

TEST_F(RuleEngineTest, UntrackedSelectionDoesNotFire) {
    // col = 'a'
    // df[col]
    // df[other]
    auto findings = run_module(node_list(
        make_assign(name("col", at(1)), make_string("a", at(1, 6)), at(1)), selection("col", 2),
        selection("other", 3)));
    EXPECT_TRUE(findings.empty());
}

TEST_F(RuleEngineTest, StatementDoesNotSeeItsOwnBinding) {
    // m = df[m]
    auto findings = run_module(node_list(
        make_assign(name("m", at(1)), subscript(name("df", at(1, 4)), name("m", at(1, 7))),
                    at(1))));
    EXPECT_TRUE(findings.empty());
}

TEST_F(RuleEngineTest, DerivedMasksAreTracked) {
    // m = df.a > 0
    // keep = ~m & df.b.notna()
    // df.loc[keep, 'a']
    auto keep = make_bin_op(make_unary_op(UnaryOperator::Invert, name("m", at(2, 8)), at(2, 7)),
                            BinaryOperator::BitAnd,
                            method(attr(name("df", at(2, 12)), "b"), "notna"), at(2, 7));
    auto key = make_tuple(node_list(name("keep", at(3, 7)), make_string("a", at(3, 13))),
                          at(3, 7));
    auto findings = run_module(node_list(
        mask_assignment("m", 1), make_assign(name("keep", at(2)), std::move(keep), at(2)),
        make_expr_stmt(subscript(attr(name("df", at(3)), "loc"), std::move(key)))));

    expect_hits(findings, {{"PMC007", 3, 0}});
}

TEST_F(RuleEngineTest, BindingsAccumulateWithinScope) {
    // m = df.a > 0
    // m = df.b.sum()
    // df[m]
    auto findings = run_module(node_list(
        mask_assignment("m", 1),
        make_assign(name("m", at(2)), method(attr(name("df", at(2, 4)), "b"), "sum"), at(2)),
        selection("m", 3)));
    expect_hits(findings, {{"PMC007", 3, 0}});
}

TEST_F(RuleEngineTest, FunctionBodyHasItsOwnScope) {
    // mask = df.a > 0
    // def f():
    //     df[mask]
    //     inner = df.a > 0
    //     df[inner]
    // df[inner]
    // df[mask]
    auto findings = run_module(node_list(
        mask_assignment("mask", 1),
        function("f", node_list(selection("mask", 3), mask_assignment("inner", 4),
                                selection("inner", 5)),
                 2),
        selection("inner", 6), selection("mask", 7)));

    expect_hits(findings, {{"PMC007", 5, 0}, {"PMC007", 7, 0}});
}

TEST_F(RuleEngineTest, ClassBodyHasItsOwnScope) {
    // mask = df.a > 0
    // class C:
    //     df[mask]
    auto findings = run_module(node_list(
        mask_assignment("mask", 1),
        make_class_def("C", node_list(selection("mask", 3)), at(2))));
    EXPECT_TRUE(findings.empty());
}

TEST_F(RuleEngineTest, LambdaBodyHasItsOwnScope) {
    // mask = df.a > 0
    // df.loc[lambda d: d[mask]]
    auto fn = make_lambda(node_list(make_other("arguments", {}),
                                    subscript(name("d", at(2, 17)), name("mask", at(2, 19)))),
                          at(2, 7));
    auto findings = run_module(node_list(
        mask_assignment("mask", 1),
        make_expr_stmt(subscript(attr(name("df", at(2)), "loc"), std::move(fn)))));
    EXPECT_TRUE(findings.empty());
}

TEST_F(RuleEngineTest, UnknownKindsAreTraversed) {
    // for _ in range(3):
    //     df = df.dropna()
    auto loop = make_other(
        "For",
        node_list(name("_", at(1, 4)),
                  make_call(name("range", at(1, 9)), node_list(make_int(3, at(1, 15))), {},
                            at(1, 9)),
                  make_assign(name("df", at(2, 4)), method(name("df", at(2, 9)), "dropna"),
                              at(2, 4))),
        at(1));
    auto findings = run_module(node_list(std::move(loop)));
    expect_hits(findings, {{"PMC002", 2, 4}});
}

// ============================================================================
// Malformed Trees
// ============================================================================

TEST_F(RuleEngineTest, AssignWithoutValue) {
    auto module = make_module(node_list(make_assign(name("df", at(1)), nullptr, at(1))));
    auto result = engine.run(*module);
    ASSERT_TRUE(is_err(result));

    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.node_kind, "Assign");
    EXPECT_EQ(error.role, "value");
    EXPECT_EQ(error.location, at(1));
    EXPECT_EQ(error.to_string(), "malformed Assign node at 1:0: missing required 'value'");
}

TEST_F(RuleEngineTest, AssignWithoutTargets) {
    auto module = make_module(node_list(make_assign(NodeList{}, make_int(1, at(2, 4)), at(2))));
    auto result = engine.run(*module);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).role, "targets");
}

TEST_F(RuleEngineTest, ReportableNodeWithoutLocation) {
    auto module = make_module(node_list(make_expr_stmt(
        make_method_call(name("df", at(1)), "dropna", SourceLocation{}))));
    auto result = engine.run(*module);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).node_kind, "Call");
    EXPECT_EQ(unwrap_err(result).role, "lineno");
    EXPECT_EQ(unwrap_err(result).to_string(), "malformed Call node: missing required 'lineno'");
}

TEST_F(RuleEngineTest, KeywordListWithNonKeyword) {
    auto call = make_call(attr(name("df", at(1)), "dropna"), {}, node_list(name("x", at(1, 10))),
                          at(1));
    auto module = make_module(node_list(make_expr_stmt(std::move(call))));
    auto result = engine.run(*module);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).role, "keywords");
}

TEST_F(RuleEngineTest, CompareWithMismatchedOperators) {
    auto cmp = make_compare(name("a", at(1)), CmpOperator::Lt, name("b", at(1, 4)), at(1));
    cmp->as<Compare>().ops.push_back(CmpOperator::Lt);
    auto module = make_module(node_list(make_expr_stmt(std::move(cmp))));

    auto result = engine.run(*module);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).node_kind, "Compare");
    EXPECT_EQ(unwrap_err(result).role, "ops");
}

TEST_F(RuleEngineTest, MalformedNodeAbortsOnlyThatTree) {
    auto broken = make_module(node_list(make_assign(name("df", at(1)), nullptr, at(1))));
    auto healthy = make_module(
        node_list(make_assign(name("df", at(1)), method(name("df", at(1, 5)), "dropna"), at(1))));

    EXPECT_TRUE(is_err(engine.run(*broken)));
    expect_hits(run(*healthy), {{"PMC002", 1, 0}});
}

/// `not not ... m` with `depth` negations, as the only statement.
static auto negations(size_t depth) -> NodePtr {
    NodePtr expr = name("m", at(1));
    for (size_t i = 0; i < depth; ++i) {
        expr = make_unary_op(UnaryOperator::Not, std::move(expr), at(1));
    }
    return make_module(node_list(make_expr_stmt(std::move(expr))));
}

TEST_F(RuleEngineTest, AcceptsNestingUpToLimit) {
    // Module, Expr and Name add three levels.
    auto module = negations(ast::MAX_TREE_DEPTH - 3);
    EXPECT_TRUE(run(*module).empty());
}

TEST_F(RuleEngineTest, RejectsNestingPastLimit) {
    auto deep = negations(ast::MAX_TREE_DEPTH - 2);
    auto result = engine.run(*deep);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).node_kind, "Name");
    EXPECT_EQ(unwrap_err(result).role, "depth");
    EXPECT_EQ(unwrap_err(result).to_string(),
              "malformed Name node at 1:0: nesting deeper than 1000 levels");

    auto far_too_deep = negations(4000);
    EXPECT_TRUE(is_err(engine.run(*far_too_deep)));

    auto healthy = make_module(
        node_list(make_assign(name("df", at(1)), method(name("df", at(1, 5)), "dropna"), at(1))));
    expect_hits(run(*healthy), {{"PMC002", 1, 0}});
}

TEST(ValidateNodeTest, AcceptsWellFormedNodes) {
    auto stmt = make_assign(name("df", at(1)), method(name("df", at(1, 5)), "dropna"), at(1));
    EXPECT_FALSE(validate_node(*stmt).has_value());

    auto bare = make_ann_assign(name("df", at(1)), name("DataFrame", at(1, 4)), nullptr, at(1));
    EXPECT_FALSE(validate_node(*bare).has_value());

    auto unknown = make_other("Pass", {});
    EXPECT_FALSE(validate_node(*unknown).has_value());
}

// ============================================================================
// Custom Rule Lists and Concurrency
// ============================================================================

TEST(RuleEngineCustomTest, RunsOnlyGivenRules) {
    std::vector<Box<Rule>> rules;
    rules.push_back(make_rule(RuleId::InplaceTrue));
    RuleEngine engine(std::move(rules));
    ASSERT_EQ(engine.rules().size(), 1u);

    auto module = make_module(node_list(
        make_assign(name("df", at(1)), method(name("df", at(1, 5)), "dropna"), at(1))));
    auto result = engine.run(*module);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).empty());
}

TEST_F(RuleEngineTest, SharedAcrossThreads) {
    auto module = make_module(node_list(
        mask_assignment("mask", 1), selection("mask", 2),
        make_assign(name("df", at(3)), method(name("df", at(3, 5)), "dropna"), at(3)),
        make_assign(subscript(name("df", at(4)), make_string("a", at(4, 3))),
                    make_int(1, at(4, 10)), at(4))));
    auto expected = run(*module);
    ASSERT_EQ(expected.size(), 3u);

    const int num_threads = 8;
    std::vector<std::vector<Finding>> results(num_threads);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, &module, &results, t]() {
            for (int i = 0; i < 50; ++i) {
                auto result = engine.run(*module);
                if (is_ok(result)) {
                    results[t] = std::move(unwrap(result));
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& result : results) {
        EXPECT_EQ(result, expected);
    }
}
