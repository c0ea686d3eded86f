//! # JSON Serializer
//!
//! Compact text output for report values. Strings are escaped as follows:
//!
//! | Character           | Escape Sequence |
//! |---------------------|-----------------|
//! | `"`                 | `\"`            |
//! | `\`                 | `\\`            |
//! | Backspace           | `\b`            |
//! | Form feed           | `\f`            |
//! | Line feed           | `\n`            |
//! | Carriage return     | `\r`            |
//! | Tab                 | `\t`            |
//! | Control (0x00-0x1F) | `\uXXXX`        |
//!
//! Bytes at or above 0x80 pass through; captured output is made valid UTF-8
//! before it reaches a `JsonValue`.

#include "json/json_value.hpp"

#include <cstdio>

namespace probeci::json {

auto escape_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                result += buf;
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

namespace {

void write_string(std::string& out, std::string_view text) {
    out += '"';
    out += escape_string(text);
    out += '"';
}

void write_value(const JsonValue& value, std::string& out) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_string()) {
        write_string(out, value.as_string());
    } else if (value.is_array()) {
        out += '[';
        const char* sep = "";
        for (const auto& elem : value.as_array()) {
            out += sep;
            write_value(elem, out);
            sep = ",";
        }
        out += ']';
    } else {
        out += '{';
        const char* sep = "";
        for (const auto& [key, field] : value.as_object()) {
            out += sep;
            write_string(out, key);
            out += ':';
            write_value(field, out);
            sep = ",";
        }
        out += '}';
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    write_value(*this, out);
    return out;
}

} // namespace probeci::json
