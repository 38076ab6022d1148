//! # JSON Parser
//!
//! Recursive descent parser that turns a JSON document (typically a dumped
//! Python syntax tree) into a `JsonValue`.
//!
//! - Numbers without fraction or exponent are kept as integers
//! - Errors carry line/column of the offending character
//! - Nesting depth is bounded; deeply nested syntax trees are legitimate
//!   input, so the bound is generous
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"_type": "Name", "id": "df"})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("id")->as_string() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string>
#include <string_view>

namespace pmc::json {

/// Single-pass JSON parser over an input buffer.
///
/// The input must outlive the parser.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses exactly one JSON value followed by end of input.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

    static constexpr size_t MAX_DEPTH = 4000;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();

    [[nodiscard]] auto error_here(const std::string& msg) const -> JsonError;
    [[nodiscard]] auto error_at(const std::string& msg, size_t line, size_t column,
                                size_t offset) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;

    /// Reads four hex digits of a `\u` escape.
    auto parse_hex4() -> Result<uint32_t, JsonError>;
};

/// Parses a JSON string and returns a `JsonValue`.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace pmc::json
