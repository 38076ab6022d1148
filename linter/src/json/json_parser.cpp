//! # JSON Parser Implementation
//!
//! Character-level recursive descent. Python's `json.dumps` escapes every
//! non-ASCII character by default, so `\uXXXX` escapes (including surrogate
//! pairs) are common in dumped syntax trees and are decoded to UTF-8 here.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace pmc::json {

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

auto JsonParser::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonParser::error_here(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

auto JsonParser::error_at(const std::string& msg, size_t line, size_t column,
                          size_t offset) const -> JsonError {
    return JsonError::make(msg, line, column, offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }

    skip_whitespace();
    if (!at_end()) {
        return error_here("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return error_here("Maximum nesting depth exceeded");
    }

    char c = peek();
    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        if (at_end()) {
            return error_here("Unexpected end of input");
        }
        return error_here("Unexpected character: \\0");
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number();
        }
        return error_here("Unexpected character: " + std::string(1, c));
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'
    skip_whitespace();

    JsonObject obj;
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            --depth_;
            return error_here("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            --depth_;
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            --depth_;
            return error_here("Expected ':' after object key");
        }
        advance();
        skip_whitespace();

        auto value = parse_value();
        if (is_err(value)) {
            --depth_;
            return value;
        }
        obj.set(std::move(unwrap(key)), std::move(unwrap(value)));

        skip_whitespace();
        char c = peek();
        if (c == ',') {
            advance();
            skip_whitespace();
            if (peek() == '}') {
                --depth_;
                return error_here("Trailing comma in object");
            }
        } else if (c == '}') {
            advance();
            --depth_;
            return JsonValue(std::move(obj));
        } else {
            --depth_;
            return error_here("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['
    skip_whitespace();

    JsonArray arr;
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        skip_whitespace();
        auto value = parse_value();
        if (is_err(value)) {
            --depth_;
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = peek();
        if (c == ',') {
            advance();
            skip_whitespace();
            if (peek() == ']') {
                --depth_;
                return error_here("Trailing comma in array");
            }
        } else if (c == ']') {
            advance();
            --depth_;
            return JsonValue(std::move(arr));
        } else {
            --depth_;
            return error_here("Expected ',' or ']' in array");
        }
    }
}

auto JsonParser::parse_hex4() -> Result<uint32_t, JsonError> {
    if (pos_ + 4 > input_.size()) {
        return error_here("Incomplete unicode escape sequence");
    }
    std::string_view hex = input_.substr(pos_, 4);
    uint32_t codepoint = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, codepoint, 16);
    if (ec != std::errc{} || ptr != hex.data() + 4) {
        return error_here("Invalid unicode escape sequence");
    }
    pos_ += 4;
    column_ += 4;
    return codepoint;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_pos = pos_;
    advance(); // opening quote

    std::string value;
    while (!at_end()) {
        char c = peek();

        if (c == '"') {
            advance();
            return value;
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            return error_here("Control character in string");
        }

        if (c != '\\') {
            value += c;
            advance();
            continue;
        }

        advance(); // backslash
        char escaped = advance();
        switch (escaped) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto first = parse_hex4();
            if (is_err(first)) {
                return unwrap_err(first);
            }
            uint32_t cp = unwrap(first);
            if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\' && pos_ + 1 < input_.size() &&
                input_[pos_ + 1] == 'u') {
                advance();
                advance();
                auto second = parse_hex4();
                if (is_err(second)) {
                    return unwrap_err(second);
                }
                uint32_t low = unwrap(second);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else {
                    // Unpaired high surrogate; keep both code units as-is.
                    append_utf8(value, cp);
                    cp = low;
                }
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return error_here("Invalid escape sequence: \\" + std::string(1, escaped));
        }
    }

    return error_at("Unterminated string", start_line, start_col, start_pos);
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start_pos = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    } else {
        return error_here("Invalid number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error_here("Expected digit after decimal point");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error_here("Expected digit in exponent");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    std::string_view text = input_.substr(start_pos, pos_ - start_pos);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return JsonValue(value);
        }
        // Out of int64 range: fall through to double.
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_keyword() -> Result<JsonValue, JsonError> {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_pos = pos_;

    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);
    if (word == "true") {
        return JsonValue(true);
    }
    if (word == "false") {
        return JsonValue(false);
    }
    if (word == "null") {
        return JsonValue(nullptr);
    }
    return error_at("Unknown keyword: " + std::string(word), start_line, start_col, start_pos);
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace pmc::json
