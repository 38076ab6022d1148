//! # JSON Value Types
//!
//! Core value types of the JSON library: `JsonNumber` keeps integers apart
//! from floats, `JsonValue` is a variant over the six JSON types.
//!
//! Objects keep their members in document order. Python's `ast` fields are
//! emitted in source order (`targets` before `value`, `func` before `args`),
//! and the tree loader relies on that order when it collects the children
//! of node kinds it does not model.
//!
//! ## Example
//!
//! ```cpp
//! JsonObject obj;
//! obj.set("_type", JsonValue("Name"));
//! obj.set("id", JsonValue("df"));
//! JsonValue node(std::move(obj));
//!
//! if (const auto* id = node.get("id"); id && id->is_string()) {
//!     std::cout << id->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pmc::json {

struct JsonValue;
class JsonObject;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number stored as an integer when the text had no fraction or
/// exponent, and as a double otherwise.
struct JsonNumber {
    enum class Kind : uint8_t {
        Int64, ///< `i64` is active
        Double ///< `f64` is active
    };

    Kind kind;

    union {
        int64_t i64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    /// Returns the value as `int64_t`, or `std::nullopt` for a float.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (kind == Kind::Int64) {
            return i64;
        }
        return std::nullopt;
    }

    /// Returns the value as `double` (may lose precision above 2^53).
    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        return kind == Kind::Int64 ? i64 == other.i64 : f64 == other.f64;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// JSON value variant type representing any JSON value.
///
/// | JSON Type | C++ Storage | Query | Accessor |
/// |-----------|-------------|-------|----------|
/// | `null` | `std::monostate` | `is_null()` | - |
/// | `true/false` | `bool` | `is_bool()` | `as_bool()` |
/// | number | `JsonNumber` | `is_number()` | `as_number()`, `as_i64()`, `as_f64()` |
/// | string | `std::string` | `is_string()` | `as_string()` |
/// | array | `Box<JsonArray>` | `is_array()` | `as_array()` |
/// | object | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
///
/// Arrays and objects are boxed so the type can be recursive. Copies are
/// deep.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue();
    JsonValue(std::nullptr_t);
    JsonValue(bool value);
    JsonValue(int value);
    JsonValue(int64_t value);
    JsonValue(double value);
    JsonValue(const char* value);
    JsonValue(std::string value);
    JsonValue(JsonNumber value);
    JsonValue(JsonArray value);
    JsonValue(JsonObject value);

    JsonValue(const JsonValue& other);
    JsonValue(JsonValue&& other) noexcept;
    auto operator=(const JsonValue& other) -> JsonValue&;
    auto operator=(JsonValue&& other) noexcept -> JsonValue&;
    ~JsonValue();

    // ------------------------------------------------------------------------
    // Type Queries
    // ------------------------------------------------------------------------

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    /// Returns `true` for numbers written without fraction or exponent.
    [[nodiscard]] auto is_integer() const -> bool {
        return is_number() && std::get<JsonNumber>(data).is_integer();
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    /// Name of the held JSON type ("null", "boolean", "number", ...).
    [[nodiscard]] auto type_name() const -> const char*;

    // ------------------------------------------------------------------------
    // Accessors (throw std::bad_variant_access on type mismatch)
    // ------------------------------------------------------------------------

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }
    [[nodiscard]] auto as_i64() const -> int64_t;
    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_array() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject&;
    [[nodiscard]] auto as_object() -> JsonObject&;

    /// Looks up an object member. Returns `nullptr` if this is not an
    /// object or the key is absent.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue*;

    // ------------------------------------------------------------------------
    // Serialization
    // ------------------------------------------------------------------------

    /// Compact serialization without whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Pretty serialization with the given indentation width.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

// ============================================================================
// JsonObject
// ============================================================================

/// A JSON object whose members keep document order.
///
/// Lookup is linear, which is the right trade-off for syntax tree nodes
/// (a handful of fields each).
class JsonObject {
public:
    using Member = std::pair<std::string, JsonValue>;

    JsonObject() = default;
    JsonObject(std::initializer_list<Member> members) : members_(members) {}

    /// Returns the member value, or `nullptr` if absent.
    [[nodiscard]] auto find(std::string_view key) const -> const JsonValue*;

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return find(key) != nullptr;
    }

    /// Sets a member, replacing an existing value in place or appending.
    void set(std::string key, JsonValue value);

    [[nodiscard]] auto size() const -> size_t {
        return members_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return members_.empty();
    }

    [[nodiscard]] auto begin() const {
        return members_.begin();
    }
    [[nodiscard]] auto end() const {
        return members_.end();
    }

    [[nodiscard]] auto operator==(const JsonObject& other) const -> bool {
        return members_ == other.members_;
    }

private:
    std::vector<Member> members_;
};

} // namespace pmc::json
