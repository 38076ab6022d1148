//! # Syntax Tree Loader
//!
//! Converts the JSON rendition of a Python `ast` tree into the syntax tree
//! model. The JSON follows the common `ast` to JSON export convention:
//!
//! ```json
//! {"_type": "Assign", "lineno": 1, "col_offset": 0,
//!  "targets": [{"_type": "Name", "lineno": 1, "col_offset": 0, "id": "df"}],
//!  "value": {"_type": "Call", ...}}
//! ```
//!
//! A document is either the `Module` object itself or an envelope naming
//! the inspected file:
//!
//! ```json
//! {"filename": "clean.py", "tree": {"_type": "Module", "body": [...]}}
//! ```
//!
//! ## Accepted Input
//!
//! - Every kind in `ast.hpp` by its Python class name (`keyword` for
//!   `Keyword`, `AsyncFunctionDef` for an async `FunctionDef`)
//! - Pre-3.8 literal kinds `NameConstant`, `Num`, `Str`, `Bytes`, `Ellipsis`
//! - Pre-3.9 slice wrappers `Index` (unwrapped) and `ExtSlice` (a `Tuple`)
//! - Operators as `{"_type": "BitAnd"}` objects or plain `"BitAnd"` strings
//! - Any other kind becomes `Other`, keeping its child nodes in field order
//!
//! Missing children are loaded as null and reported later by the engine.
//! The loader itself rejects input that is not a syntax tree at all: a
//! node that is not an object, a missing `_type`, a field of the wrong
//! JSON type, or a modelled node without a position.

#ifndef PMC_AST_LOADER_HPP
#define PMC_AST_LOADER_HPP

#include "ast/ast.hpp"
#include "json/json_value.hpp"

#include <string>
#include <string_view>

namespace pmc::ast {

/// An error produced while loading a tree.
struct LoadError {
    /// Human-readable error description.
    std::string message;

    /// JSON path of the offending value, e.g. `$.body[2].value.func`.
    std::string path;

    static auto make(std::string msg, std::string path) -> LoadError {
        return LoadError{std::move(msg), std::move(path)};
    }

    /// Formats the error as `path: message`.
    [[nodiscard]] auto to_string() const -> std::string {
        if (path.empty()) {
            return message;
        }
        return path + ": " + message;
    }
};

/// A loaded input: the inspected file's name and its tree.
struct Document {
    /// File name from the envelope, empty if the input had none.
    std::string filename;

    /// Root of the tree, normally a `Module`.
    NodePtr tree;
};

/// Loads a single node (and its subtree) from JSON.
[[nodiscard]] auto load_tree(const json::JsonValue& json) -> Result<NodePtr, LoadError>;

/// Loads a document, accepting either a bare tree or an envelope.
[[nodiscard]] auto load_document(const json::JsonValue& json) -> Result<Document, LoadError>;

/// Parses JSON text and loads the document it contains. JSON syntax errors
/// are reported as a `LoadError` carrying the text position.
[[nodiscard]] auto load_document_text(std::string_view text) -> Result<Document, LoadError>;

} // namespace pmc::ast

#endif // PMC_AST_LOADER_HPP
