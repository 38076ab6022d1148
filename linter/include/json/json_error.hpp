//! # JSON Error Type
//!
//! Error returned when a JSON document cannot be parsed. Carries the
//! position in the input text so that a broken tree dump can be located.
//!
//! ```cpp
//! auto error = JsonError::make("Unexpected token", 5, 12);
//! std::cerr << error.to_string() << std::endl;
//! // line 5, column 12: Unexpected token
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace pmc::json {

/// An error encountered during JSON parsing.
struct JsonError {
    /// Human-readable error description.
    std::string message;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in input where the error occurred.
    size_t offset = 0;

    /// Creates an error with message only.
    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    /// Creates an error with location information.
    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `line X, column Y: message` (location parts
    /// are omitted when unknown).
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace pmc::json
