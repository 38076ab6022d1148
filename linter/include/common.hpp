//! # Common Definitions
//!
//! This module provides common types and utilities used throughout the
//! pmc checker. Every other component depends on it.
//!
//! ## Overview
//!
//! - **Version Information**: Checker version constants
//! - **Source Locations**: Positions of syntax tree nodes
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership

#ifndef PMC_COMMON_HPP
#define PMC_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace pmc {

// ============================================================================
// Version Information
// ============================================================================

/// The checker version string.
constexpr const char* VERSION = "0.1.0";

/// Name under which the checker reports itself.
constexpr const char* PLUGIN_NAME = "pandas-method-chaining";

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in the inspected Python source.
///
/// Mirrors the positions Python's `ast` module records: `line` is 1-based
/// (`lineno`), `column` is the 0-based offset of the node's first
/// character (`col_offset`). A default-constructed location (line 0) means
/// the node carried no position.
struct SourceLocation {
    /// Line number (1-based, 0 if unknown).
    uint32_t line = 0;

    /// Column offset (0-based).
    uint32_t column = 0;

    /// Returns `true` if this location refers to a real source position.
    [[nodiscard]] auto is_known() const -> bool {
        return line > 0;
    }

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// Formats a location as `line:column`.
inline auto to_string(const SourceLocation& loc) -> std::string {
    return std::to_string(loc.line) + ":" + std::to_string(loc.column);
}

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// auto result = ast::load_tree(json);
/// if (is_ok(result)) {
///     const auto& tree = unwrap(result);
/// } else {
///     std::cerr << unwrap_err(result).to_string() << "\n";
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace pmc

#endif // PMC_COMMON_HPP
