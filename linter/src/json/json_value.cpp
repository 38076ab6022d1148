//! # JSON Value Implementation
//!
//! Special members of `JsonValue` (deep copies of boxed containers),
//! `JsonObject` member access, and the serializer used by the JSON reporter.

#include "json/json_value.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

namespace pmc::json {

// ============================================================================
// Construction
// ============================================================================

JsonValue::JsonValue() : data(Null{}) {}
JsonValue::JsonValue(std::nullptr_t) : data(Null{}) {}
JsonValue::JsonValue(bool value) : data(value) {}
JsonValue::JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
JsonValue::JsonValue(int64_t value) : data(JsonNumber(value)) {}
JsonValue::JsonValue(double value) : data(JsonNumber(value)) {}
JsonValue::JsonValue(const char* value) : data(std::string(value)) {}
JsonValue::JsonValue(std::string value) : data(std::move(value)) {}
JsonValue::JsonValue(JsonNumber value) : data(value) {}
JsonValue::JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
JsonValue::JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

static auto clone_variant(const JsonValue::ValueVariant& source) -> JsonValue::ValueVariant {
    return std::visit(
        [](const auto& v) -> JsonValue::ValueVariant {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Box<JsonArray>>) {
                return make_box<JsonArray>(*v);
            } else if constexpr (std::is_same_v<T, Box<JsonObject>>) {
                return make_box<JsonObject>(*v);
            } else {
                return v;
            }
        },
        source);
}

JsonValue::JsonValue(const JsonValue& other) : data(clone_variant(other.data)) {}

JsonValue::JsonValue(JsonValue&& other) noexcept = default;

auto JsonValue::operator=(const JsonValue& other) -> JsonValue& {
    if (this != &other) {
        data = clone_variant(other.data);
    }
    return *this;
}

auto JsonValue::operator=(JsonValue&& other) noexcept -> JsonValue& = default;

JsonValue::~JsonValue() = default;

// ============================================================================
// Accessors
// ============================================================================

auto JsonValue::type_name() const -> const char* {
    switch (data.index()) {
    case 0:
        return "null";
    case 1:
        return "boolean";
    case 2:
        return "number";
    case 3:
        return "string";
    case 4:
        return "array";
    case 5:
        return "object";
    }
    return "unknown";
}

auto JsonValue::as_i64() const -> int64_t {
    const auto& num = as_number();
    if (auto value = num.try_as_i64()) {
        return *value;
    }
    return static_cast<int64_t>(num.as_f64());
}

auto JsonValue::as_object() const -> const JsonObject& {
    return *std::get<Box<JsonObject>>(data);
}

auto JsonValue::as_object() -> JsonObject& {
    return *std::get<Box<JsonObject>>(data);
}

auto JsonValue::get(std::string_view key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    return as_object().find(key);
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    if (is_object()) {
        return as_object() == other.as_object();
    }
    return data == other.data;
}

// ============================================================================
// JsonObject
// ============================================================================

auto JsonObject::find(std::string_view key) const -> const JsonValue* {
    for (const auto& [name, value] : members_) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

void JsonObject::set(std::string key, JsonValue value) {
    for (auto& [name, existing] : members_) {
        if (name == key) {
            existing = std::move(value);
            return;
        }
    }
    members_.emplace_back(std::move(key), std::move(value));
}

// ============================================================================
// Serialization
// ============================================================================

static void write_string(std::ostringstream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\b':
            out << "\\b";
            break;
        case '\f':
            out << "\\f";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                static const char* hex = "0123456789abcdef";
                out << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
            } else {
                out << c;
            }
        }
    }
    out << '"';
}

static void write_number(std::ostringstream& out, const JsonNumber& num) {
    if (num.is_integer()) {
        out << num.i64;
        return;
    }
    if (!std::isfinite(num.f64)) {
        // JSON has no representation for NaN or infinities.
        out << "null";
        return;
    }
    std::ostringstream tmp;
    tmp.precision(17);
    tmp << num.f64;
    std::string text = tmp.str();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    out << text;
}

static void write_value(std::ostringstream& out, const JsonValue& value, int indent, int depth) {
    auto newline = [&](int level) {
        if (indent > 0) {
            out << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
        }
    };

    if (value.is_null()) {
        out << "null";
    } else if (value.is_bool()) {
        out << (value.as_bool() ? "true" : "false");
    } else if (value.is_number()) {
        write_number(out, value.as_number());
    } else if (value.is_string()) {
        write_string(out, value.as_string());
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        out << '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0)
                out << ',';
            newline(depth + 1);
            write_value(out, arr[i], indent, depth + 1);
        }
        if (!arr.empty())
            newline(depth);
        out << ']';
    } else {
        const auto& obj = value.as_object();
        out << '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first)
                out << ',';
            first = false;
            newline(depth + 1);
            write_string(out, key);
            out << (indent > 0 ? ": " : ":");
            write_value(out, member, indent, depth + 1);
        }
        if (!obj.empty())
            newline(depth);
        out << '}';
    }
}

auto JsonValue::to_string() const -> std::string {
    std::ostringstream out;
    write_value(out, *this, 0, 0);
    return out.str();
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::ostringstream out;
    write_value(out, *this, indent, 0);
    return out.str();
}

} // namespace pmc::json
