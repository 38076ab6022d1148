//! # Syntax Tree Model
//!
//! The closed set of Python syntax node kinds the checker understands.
//! Every kind carries only the fields the rules inspect; anything else in
//! the source tree is kept as an `Other` node that still owns its children,
//! so the engine can walk into it.
//!
//! ## Kinds
//!
//! | Kind | Fields |
//! |------|--------|
//! | `Module` | `body` |
//! | `FunctionDef` | `name`, `is_async`, `children` |
//! | `ClassDef` | `name`, `children` |
//! | `Lambda` | `children` |
//! | `Assign` | `targets`, `value` |
//! | `AnnAssign` | `target`, `annotation`, `value` (optional) |
//! | `AugAssign` | `target`, `op`, `value` |
//! | `Call` | `func`, `args`, `keywords` |
//! | `Keyword` | `arg` (optional), `value` |
//! | `Attribute` | `value`, `attr` |
//! | `Subscript` | `value`, `slice` |
//! | `Name` | `id` |
//! | `Constant` | `kind`, `text` |
//! | `Compare` | `left`, `ops`, `comparators` |
//! | `BoolOp` | `op`, `values` |
//! | `BinOp` | `left`, `op`, `right` |
//! | `UnaryOp` | `op`, `operand` |
//! | `Tuple` | `elts` |
//! | `Other` | `type_name`, `children` |
//!
//! Required children may be null in a tree that was built from malformed
//! input. The engine checks them before any rule sees the node.

#ifndef PMC_AST_HPP
#define PMC_AST_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pmc::ast {

struct Node;
using NodePtr = Box<Node>;
using NodeList = std::vector<NodePtr>;

// ============================================================================
// Operators
// ============================================================================

/// Arithmetic and bitwise binary operators (`BinOp`, `AugAssign`).
enum class BinaryOperator {
    Add,
    Sub,
    Mult,
    MatMult,
    Div,
    Mod,
    Pow,
    LShift,
    RShift,
    BitOr,  ///< `|`
    BitXor, ///< `^`
    BitAnd, ///< `&`
    FloorDiv,
    Unknown,
};

/// Unary operators.
enum class UnaryOperator {
    Invert, ///< `~x`
    Not,    ///< `not x`
    UAdd,
    USub,
    Unknown,
};

/// Boolean connectives.
enum class BoolOperator {
    And,
    Or,
    Unknown,
};

/// Comparison operators.
enum class CmpOperator {
    Eq,
    NotEq,
    Lt,
    LtE,
    Gt,
    GtE,
    Is,
    IsNot,
    In,
    NotIn,
    Unknown,
};

/// Maps a Python operator class name (`"BitAnd"`) to its enum.
[[nodiscard]] auto binary_operator_from_name(std::string_view name) -> BinaryOperator;
[[nodiscard]] auto unary_operator_from_name(std::string_view name) -> UnaryOperator;
[[nodiscard]] auto bool_operator_from_name(std::string_view name) -> BoolOperator;
[[nodiscard]] auto cmp_operator_from_name(std::string_view name) -> CmpOperator;

// ============================================================================
// Scopes
// ============================================================================

/// Module root: `body` holds the top-level statements.
struct Module {
    NodeList body;
};

/// `def` or `async def`. Arguments, decorators, body and annotations are
/// kept in field order in `children`.
struct FunctionDef {
    std::string name;
    bool is_async = false;
    NodeList children;
};

/// `class` definition; bases, keywords, body and decorators in `children`.
struct ClassDef {
    std::string name;
    NodeList children;
};

/// `lambda` expression; arguments and body in `children`.
struct Lambda {
    NodeList children;
};

// ============================================================================
// Binding Statements
// ============================================================================

/// `a = b = value`
struct Assign {
    NodeList targets;
    NodePtr value;
};

/// `target: annotation = value`
struct AnnAssign {
    NodePtr target;
    NodePtr annotation;
    NodePtr value; ///< Null for a bare annotation.
};

/// `target op= value`
struct AugAssign {
    NodePtr target;
    BinaryOperator op = BinaryOperator::Unknown;
    NodePtr value;
};

// ============================================================================
// Expressions
// ============================================================================

/// `func(args..., keywords...)`
struct Call {
    NodePtr func;
    NodeList args;
    NodeList keywords; ///< `Keyword` nodes.
};

/// `arg=value` inside a call, or `**value` when `arg` is empty.
struct Keyword {
    std::optional<std::string> arg;
    NodePtr value;
};

/// `value.attr`
struct Attribute {
    NodePtr value;
    std::string attr;
};

/// `value[slice]`
struct Subscript {
    NodePtr value;
    NodePtr slice;
};

/// A plain identifier.
struct Name {
    std::string id;
};

/// Literal value categories.
enum class ConstantKind {
    Bool,
    None,
    Int,
    Float,
    String,
    Other, ///< bytes, complex, Ellipsis, ...
};

/// A literal. `text` holds the Python spelling for `True`/`False`/`None`
/// and numbers, and the decoded value for strings.
struct Constant {
    ConstantKind kind = ConstantKind::Other;
    std::string text;

    [[nodiscard]] auto is_true() const -> bool {
        return kind == ConstantKind::Bool && text == "True";
    }
};

/// `left op1 c1 op2 c2 ...`
struct Compare {
    NodePtr left;
    std::vector<CmpOperator> ops;
    NodeList comparators;
};

/// `a and b and c` / `a or b`
struct BoolOp {
    BoolOperator op = BoolOperator::Unknown;
    NodeList values;
};

/// `left op right`
struct BinOp {
    NodePtr left;
    BinaryOperator op = BinaryOperator::Unknown;
    NodePtr right;
};

/// `op operand`
struct UnaryOp {
    UnaryOperator op = UnaryOperator::Unknown;
    NodePtr operand;
};

/// `(a, b)`, also an unparenthesised subscript key `df.loc[m, "a"]`.
struct Tuple {
    NodeList elts;
};

/// Any node kind the rules do not inspect.
struct Other {
    std::string type_name; ///< Python class name, e.g. `"For"`.
    NodeList children;     ///< Child nodes in field order.
};

// ============================================================================
// Node
// ============================================================================

/// A syntax tree node: a kind plus the position of its first character.
struct Node {
    std::variant<Module, FunctionDef, ClassDef, Lambda, Assign, AnnAssign, AugAssign, Call,
                 Keyword, Attribute, Subscript, Name, Constant, Compare, BoolOp, BinOp, UnaryOp,
                 Tuple, Other>
        kind;
    SourceLocation loc;

    /// Checks if this node is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this node as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    /// Gets this node as kind `T` (const). Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    /// Returns a pointer to the kind payload, or `nullptr` if the node is of
    /// another kind.
    template <typename T> [[nodiscard]] auto get_if() const -> const T* {
        return std::get_if<T>(&kind);
    }

    /// Python class name of the node (`"Assign"`, or the original name for
    /// `Other`).
    [[nodiscard]] auto kind_name() const -> std::string_view;

    /// Returns `true` for the kinds that open a new binding scope.
    [[nodiscard]] auto opens_scope() const -> bool {
        return is<FunctionDef>() || is<ClassDef>() || is<Lambda>();
    }
};

/// Deepest node nesting the loader and the engine accept. Python's own
/// recursion limit keeps real `ast` dumps well below it.
constexpr size_t MAX_TREE_DEPTH = 1000;

/// Returns the non-null direct children of `node` in source order.
[[nodiscard]] auto children(const Node& node) -> std::vector<const Node*>;

/// Counts `node` and all of its descendants.
[[nodiscard]] auto count_nodes(const Node& node) -> size_t;

} // namespace pmc::ast

#endif // PMC_AST_HPP
