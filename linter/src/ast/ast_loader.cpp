//! # Syntax Tree Loader Implementation
//!
//! A recursive walk over the JSON document. Each call carries the JSON path
//! of the value it is looking at so that errors point at the exact member.

#include "ast/ast_loader.hpp"

#include "ast/ast_builder.hpp"
#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <limits>
#include <optional>

namespace pmc::ast {

namespace {

using json::JsonObject;
using json::JsonValue;

auto member_path(const std::string& path, std::string_view field) -> std::string {
    std::string result = path;
    result += '.';
    result += field;
    return result;
}

auto index_path(const std::string& path, size_t index) -> std::string {
    return path + "[" + std::to_string(index) + "]";
}

/// Members of a node object that never hold child nodes.
auto is_skipped_field(std::string_view key) -> bool {
    return key.empty() || key[0] == '_' || key == "lineno" || key == "col_offset" ||
           key == "end_lineno" || key == "end_col_offset" || key == "ctx" ||
           key == "type_comment";
}

auto is_node_object(const JsonValue& value) -> bool {
    if (!value.is_object()) {
        return false;
    }
    const JsonValue* type = value.get("_type");
    return type != nullptr && type->is_string();
}

/// Kinds that must carry `lineno`/`col_offset`. `Module` has no position,
/// and `keyword` only has one from Python 3.9 on.
auto requires_location(std::string_view kind) -> bool {
    return kind == "FunctionDef" || kind == "AsyncFunctionDef" || kind == "ClassDef" ||
           kind == "Lambda" || kind == "Assign" || kind == "AnnAssign" || kind == "AugAssign" ||
           kind == "Call" || kind == "Attribute" || kind == "Subscript" || kind == "Name" ||
           kind == "Constant" || kind == "NameConstant" || kind == "Num" || kind == "Str" ||
           kind == "Compare" || kind == "BoolOp" || kind == "BinOp" || kind == "UnaryOp" ||
           kind == "Tuple";
}

/// Counts one nesting level for the lifetime of the guard.
class DepthGuard {
public:
    explicit DepthGuard(size_t& depth) : depth_(depth) {
        ++depth_;
    }
    ~DepthGuard() {
        --depth_;
    }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    size_t& depth_;
};

auto too_deep(const std::string& path) -> LoadError {
    return LoadError::make("nesting deeper than " + std::to_string(MAX_TREE_DEPTH) + " levels",
                           path);
}

class TreeLoader {
public:
    auto load(const JsonValue& json, const std::string& path) -> Result<NodePtr, LoadError>;

    [[nodiscard]] auto nodes_loaded() const -> size_t {
        return nodes_loaded_;
    }

private:
    size_t nodes_loaded_ = 0;
    size_t depth_ = 0;

    auto load_kind(const std::string& kind, const JsonObject& obj, SourceLocation loc,
                   const std::string& path) -> Result<NodePtr, LoadError>;

    auto load_child(const JsonObject& obj, std::string_view field, const std::string& path)
        -> Result<NodePtr, LoadError>;
    auto load_list(const JsonObject& obj, std::string_view field, const std::string& path)
        -> Result<NodeList, LoadError>;
    auto load_generic_children(const JsonObject& obj, const std::string& path)
        -> Result<NodeList, LoadError>;
    auto collect_nodes(const JsonValue& value, const std::string& path, NodeList& out)
        -> std::optional<LoadError>;

    auto load_location(const JsonObject& obj, const std::string& path, bool required)
        -> Result<SourceLocation, LoadError>;
    auto load_constant(const std::string& kind, const JsonObject& obj, SourceLocation loc,
                       const std::string& path) -> Result<NodePtr, LoadError>;
};

// ============================================================================
// Scalar Fields
// ============================================================================

auto string_field(const JsonObject& obj, std::string_view field, const std::string& path)
    -> Result<std::string, LoadError> {
    const JsonValue* value = obj.find(field);
    if (value == nullptr || value->is_null()) {
        return std::string{};
    }
    if (!value->is_string()) {
        return LoadError::make(std::string("expected a string, found ") + value->type_name(),
                               member_path(path, field));
    }
    return value->as_string();
}

/// Reads an operator given as `{"_type": "Add"}` or `"Add"`.
auto operator_name(const JsonValue* value, const std::string& path)
    -> Result<std::string, LoadError> {
    if (value == nullptr || value->is_null()) {
        return std::string{};
    }
    if (value->is_string()) {
        return value->as_string();
    }
    if (is_node_object(*value)) {
        return value->get("_type")->as_string();
    }
    return LoadError::make(std::string("expected an operator, found ") + value->type_name(),
                           path);
}

auto operator_field(const JsonObject& obj, std::string_view field, const std::string& path)
    -> Result<std::string, LoadError> {
    return operator_name(obj.find(field), member_path(path, field));
}

auto integer_position(const JsonValue* value, uint32_t min, const std::string& path)
    -> Result<uint32_t, LoadError> {
    if (!value->is_integer()) {
        return LoadError::make(std::string("expected an integer, found ") + value->type_name(),
                               path);
    }
    int64_t raw = value->as_i64();
    if (raw < static_cast<int64_t>(min) || raw > std::numeric_limits<uint32_t>::max()) {
        return LoadError::make("position out of range: " + std::to_string(raw), path);
    }
    return static_cast<uint32_t>(raw);
}

// ============================================================================
// TreeLoader
// ============================================================================

auto TreeLoader::load_location(const JsonObject& obj, const std::string& path, bool required)
    -> Result<SourceLocation, LoadError> {
    const JsonValue* lineno = obj.find("lineno");
    const JsonValue* col_offset = obj.find("col_offset");
    bool has_line = lineno != nullptr && !lineno->is_null();
    bool has_col = col_offset != nullptr && !col_offset->is_null();

    if (!has_line || !has_col) {
        if (required) {
            return LoadError::make(has_line ? "missing 'col_offset'" : "missing 'lineno'", path);
        }
        return SourceLocation{};
    }

    auto line = integer_position(lineno, 1, member_path(path, "lineno"));
    if (is_err(line)) {
        return unwrap_err(line);
    }
    auto column = integer_position(col_offset, 0, member_path(path, "col_offset"));
    if (is_err(column)) {
        return unwrap_err(column);
    }
    return SourceLocation{unwrap(line), unwrap(column)};
}

auto TreeLoader::load(const JsonValue& json, const std::string& path)
    -> Result<NodePtr, LoadError> {
    if (depth_ >= MAX_TREE_DEPTH) {
        return too_deep(path);
    }
    DepthGuard guard(depth_);

    if (!json.is_object()) {
        return LoadError::make(std::string("expected a node object, found ") + json.type_name(),
                               path);
    }
    const JsonObject& obj = json.as_object();

    const JsonValue* type = obj.find("_type");
    if (type == nullptr || !type->is_string()) {
        return LoadError::make("node object without '_type'", path);
    }
    const std::string& kind = type->as_string();

    // Pre-3.9 slice wrapper: the wrapped expression takes its place.
    if (kind == "Index") {
        auto inner = load_child(obj, "value", path);
        if (is_ok(inner) && !unwrap(inner)) {
            return LoadError::make("'Index' without 'value'", path);
        }
        return inner;
    }

    auto loc = load_location(obj, path, requires_location(kind));
    if (is_err(loc)) {
        return unwrap_err(loc);
    }

    ++nodes_loaded_;
    return load_kind(kind, obj, unwrap(loc), path);
}

auto TreeLoader::load_kind(const std::string& kind, const JsonObject& obj, SourceLocation loc,
                           const std::string& path) -> Result<NodePtr, LoadError> {
    if (kind == "Module") {
        auto body = load_list(obj, "body", path);
        if (is_err(body)) {
            return unwrap_err(body);
        }
        return make_node(Module{std::move(unwrap(body))}, loc);
    }

    if (kind == "FunctionDef" || kind == "AsyncFunctionDef" || kind == "ClassDef") {
        auto name = string_field(obj, "name", path);
        if (is_err(name)) {
            return unwrap_err(name);
        }
        auto children = load_generic_children(obj, path);
        if (is_err(children)) {
            return unwrap_err(children);
        }
        if (kind == "ClassDef") {
            return make_node(ClassDef{std::move(unwrap(name)), std::move(unwrap(children))}, loc);
        }
        return make_node(FunctionDef{std::move(unwrap(name)), kind == "AsyncFunctionDef",
                                     std::move(unwrap(children))},
                         loc);
    }

    if (kind == "Lambda") {
        auto children = load_generic_children(obj, path);
        if (is_err(children)) {
            return unwrap_err(children);
        }
        return make_node(Lambda{std::move(unwrap(children))}, loc);
    }

    if (kind == "Assign") {
        auto targets = load_list(obj, "targets", path);
        if (is_err(targets)) {
            return unwrap_err(targets);
        }
        auto value = load_child(obj, "value", path);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        return make_node(Assign{std::move(unwrap(targets)), std::move(unwrap(value))}, loc);
    }

    if (kind == "AnnAssign") {
        auto target = load_child(obj, "target", path);
        if (is_err(target)) {
            return unwrap_err(target);
        }
        auto annotation = load_child(obj, "annotation", path);
        if (is_err(annotation)) {
            return unwrap_err(annotation);
        }
        auto value = load_child(obj, "value", path);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        return make_node(AnnAssign{std::move(unwrap(target)), std::move(unwrap(annotation)),
                                   std::move(unwrap(value))},
                         loc);
    }

    if (kind == "AugAssign" || kind == "BinOp") {
        bool is_aug = kind == "AugAssign";
        auto left = load_child(obj, is_aug ? "target" : "left", path);
        if (is_err(left)) {
            return unwrap_err(left);
        }
        auto op = operator_field(obj, "op", path);
        if (is_err(op)) {
            return unwrap_err(op);
        }
        auto right = load_child(obj, is_aug ? "value" : "right", path);
        if (is_err(right)) {
            return unwrap_err(right);
        }
        auto bin_op = binary_operator_from_name(unwrap(op));
        if (is_aug) {
            return make_node(AugAssign{std::move(unwrap(left)), bin_op, std::move(unwrap(right))},
                             loc);
        }
        return make_node(BinOp{std::move(unwrap(left)), bin_op, std::move(unwrap(right))}, loc);
    }

    if (kind == "Call") {
        auto func = load_child(obj, "func", path);
        if (is_err(func)) {
            return unwrap_err(func);
        }
        auto args = load_list(obj, "args", path);
        if (is_err(args)) {
            return unwrap_err(args);
        }
        auto keywords = load_list(obj, "keywords", path);
        if (is_err(keywords)) {
            return unwrap_err(keywords);
        }
        return make_node(Call{std::move(unwrap(func)), std::move(unwrap(args)),
                              std::move(unwrap(keywords))},
                         loc);
    }

    if (kind == "keyword") {
        const JsonValue* arg = obj.find("arg");
        Keyword keyword;
        if (arg != nullptr && !arg->is_null()) {
            if (!arg->is_string()) {
                return LoadError::make(std::string("expected a string, found ") + arg->type_name(),
                                       member_path(path, "arg"));
            }
            keyword.arg = arg->as_string();
        }
        auto value = load_child(obj, "value", path);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        keyword.value = std::move(unwrap(value));
        return make_node(std::move(keyword), loc);
    }

    if (kind == "Attribute") {
        auto value = load_child(obj, "value", path);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        auto attr = string_field(obj, "attr", path);
        if (is_err(attr)) {
            return unwrap_err(attr);
        }
        return make_node(Attribute{std::move(unwrap(value)), std::move(unwrap(attr))}, loc);
    }

    if (kind == "Subscript") {
        auto value = load_child(obj, "value", path);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        auto slice = load_child(obj, "slice", path);
        if (is_err(slice)) {
            return unwrap_err(slice);
        }
        return make_node(Subscript{std::move(unwrap(value)), std::move(unwrap(slice))}, loc);
    }

    if (kind == "Name") {
        auto id = string_field(obj, "id", path);
        if (is_err(id)) {
            return unwrap_err(id);
        }
        return make_node(Name{std::move(unwrap(id))}, loc);
    }

    if (kind == "Constant" || kind == "NameConstant" || kind == "Num" || kind == "Str" ||
        kind == "Bytes" || kind == "Ellipsis") {
        return load_constant(kind, obj, loc, path);
    }

    if (kind == "Compare") {
        auto left = load_child(obj, "left", path);
        if (is_err(left)) {
            return unwrap_err(left);
        }
        Compare cmp;
        cmp.left = std::move(unwrap(left));

        const JsonValue* ops = obj.find("ops");
        if (ops != nullptr && !ops->is_null()) {
            std::string ops_path = member_path(path, "ops");
            if (!ops->is_array()) {
                return LoadError::make(std::string("expected an array, found ") + ops->type_name(),
                                       ops_path);
            }
            const auto& items = ops->as_array();
            for (size_t i = 0; i < items.size(); ++i) {
                auto op = operator_name(&items[i], index_path(ops_path, i));
                if (is_err(op)) {
                    return unwrap_err(op);
                }
                cmp.ops.push_back(cmp_operator_from_name(unwrap(op)));
            }
        }

        auto comparators = load_list(obj, "comparators", path);
        if (is_err(comparators)) {
            return unwrap_err(comparators);
        }
        cmp.comparators = std::move(unwrap(comparators));
        return make_node(std::move(cmp), loc);
    }

    if (kind == "BoolOp") {
        auto op = operator_field(obj, "op", path);
        if (is_err(op)) {
            return unwrap_err(op);
        }
        auto values = load_list(obj, "values", path);
        if (is_err(values)) {
            return unwrap_err(values);
        }
        return make_node(BoolOp{bool_operator_from_name(unwrap(op)), std::move(unwrap(values))},
                         loc);
    }

    if (kind == "UnaryOp") {
        auto op = operator_field(obj, "op", path);
        if (is_err(op)) {
            return unwrap_err(op);
        }
        auto operand = load_child(obj, "operand", path);
        if (is_err(operand)) {
            return unwrap_err(operand);
        }
        return make_node(UnaryOp{unary_operator_from_name(unwrap(op)), std::move(unwrap(operand))},
                         loc);
    }

    if (kind == "Tuple" || kind == "ExtSlice") {
        auto elts = load_list(obj, kind == "Tuple" ? "elts" : "dims", path);
        if (is_err(elts)) {
            return unwrap_err(elts);
        }
        auto& items = unwrap(elts);
        if (!loc.is_known() && !items.empty()) {
            loc = items.front()->loc;
        }
        return make_node(Tuple{std::move(items)}, loc);
    }

    PMC_LOG_TRACE("loader", "Unmodelled node kind '" << kind << "' at " << path);
    auto children = load_generic_children(obj, path);
    if (is_err(children)) {
        return unwrap_err(children);
    }
    return make_node(Other{kind, std::move(unwrap(children))}, loc);
}

auto TreeLoader::load_constant(const std::string& kind, const JsonObject& obj, SourceLocation loc,
                               const std::string& path) -> Result<NodePtr, LoadError> {
    if (kind == "Bytes" || kind == "Ellipsis") {
        return make_node(Constant{ConstantKind::Other, kind}, loc);
    }

    std::string_view field = "value";
    if (kind == "Num") {
        field = "n";
    } else if (kind == "Str") {
        field = "s";
    }

    const JsonValue* value = obj.find(field);
    if (value == nullptr || value->is_null()) {
        return make_node(Constant{ConstantKind::None, "None"}, loc);
    }
    if (value->is_bool()) {
        return make_node(Constant{ConstantKind::Bool, value->as_bool() ? "True" : "False"}, loc);
    }
    if (value->is_integer()) {
        return make_node(Constant{ConstantKind::Int, value->to_string()}, loc);
    }
    if (value->is_number()) {
        return make_node(Constant{ConstantKind::Float, value->to_string()}, loc);
    }
    if (value->is_string()) {
        return make_node(Constant{ConstantKind::String, value->as_string()}, loc);
    }
    // Exporters differ on bytes, complex and Ellipsis; none of them matter
    // to the rules.
    PMC_LOG_TRACE("loader", "Opaque constant at " << member_path(path, field));
    return make_node(Constant{ConstantKind::Other, value->to_string()}, loc);
}

auto TreeLoader::load_child(const JsonObject& obj, std::string_view field,
                            const std::string& path) -> Result<NodePtr, LoadError> {
    const JsonValue* value = obj.find(field);
    if (value == nullptr || value->is_null()) {
        return NodePtr{};
    }
    return load(*value, member_path(path, field));
}

auto TreeLoader::load_list(const JsonObject& obj, std::string_view field,
                           const std::string& path) -> Result<NodeList, LoadError> {
    NodeList nodes;
    const JsonValue* value = obj.find(field);
    if (value == nullptr || value->is_null()) {
        return nodes;
    }

    std::string list_path = member_path(path, field);
    if (!value->is_array()) {
        return LoadError::make(std::string("expected an array, found ") + value->type_name(),
                               list_path);
    }

    const auto& items = value->as_array();
    nodes.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].is_null()) {
            continue;
        }
        auto node = load(items[i], index_path(list_path, i));
        if (is_err(node)) {
            return unwrap_err(node);
        }
        nodes.push_back(std::move(unwrap(node)));
    }
    return nodes;
}

auto TreeLoader::load_generic_children(const JsonObject& obj, const std::string& path)
    -> Result<NodeList, LoadError> {
    NodeList children;
    for (const auto& [key, value] : obj) {
        if (is_skipped_field(key)) {
            continue;
        }
        if (auto error = collect_nodes(value, member_path(path, key), children)) {
            return *error;
        }
    }
    return children;
}

auto TreeLoader::collect_nodes(const JsonValue& value, const std::string& path, NodeList& out)
    -> std::optional<LoadError> {
    if (is_node_object(value)) {
        auto node = load(value, path);
        if (is_err(node)) {
            return unwrap_err(node);
        }
        out.push_back(std::move(unwrap(node)));
        return std::nullopt;
    }
    if (value.is_array()) {
        if (depth_ >= MAX_TREE_DEPTH) {
            return too_deep(path);
        }
        DepthGuard guard(depth_);

        const auto& items = value.as_array();
        for (size_t i = 0; i < items.size(); ++i) {
            if (auto error = collect_nodes(items[i], index_path(path, i), out)) {
                return error;
            }
        }
    }
    // Scalars (names, docstring flags, ...) carry no children.
    return std::nullopt;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

auto load_tree(const json::JsonValue& json) -> Result<NodePtr, LoadError> {
    TreeLoader loader;
    auto tree = loader.load(json, "$");
    if (is_ok(tree)) {
        PMC_LOG_DEBUG("loader", "Loaded " << loader.nodes_loaded() << " nodes");
    }
    return tree;
}

auto load_document(const json::JsonValue& json) -> Result<Document, LoadError> {
    Document doc;

    const json::JsonValue* tree_json = &json;
    std::string tree_path = "$";
    if (json.is_object() && json.get("_type") == nullptr && json.get("tree") != nullptr) {
        auto filename = string_field(json.as_object(), "filename", "$");
        if (is_err(filename)) {
            return unwrap_err(filename);
        }
        doc.filename = std::move(unwrap(filename));
        tree_json = json.get("tree");
        tree_path = "$.tree";
    }

    TreeLoader loader;
    auto tree = loader.load(*tree_json, tree_path);
    if (is_err(tree)) {
        return unwrap_err(tree);
    }
    doc.tree = std::move(unwrap(tree));

    PMC_LOG_DEBUG("loader", "Loaded " << loader.nodes_loaded() << " nodes"
                                      << (doc.filename.empty() ? "" : " for ") << doc.filename);
    return doc;
}

auto load_document_text(std::string_view text) -> Result<Document, LoadError> {
    auto json = json::parse_json(text);
    if (is_err(json)) {
        return LoadError::make("invalid JSON: " + unwrap_err(json).to_string(), "");
    }
    return load_document(unwrap(json));
}

} // namespace pmc::ast
