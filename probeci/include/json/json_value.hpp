//! # JSON Report Values
//!
//! The document model behind the result payload. A report only ever holds
//! booleans, strings and a list of feature names, so those are the value
//! kinds carried here, plus `null` as the empty state.
//!
//! ```cpp
//! auto report = json_object();
//! report.set("build", JsonValue(true));
//! report.set("build_stdout", JsonValue("Compiling..."));
//! report.to_string(); // {"build":true,"build_stdout":"Compiling..."}
//! ```

#pragma once

#include "common.hpp"

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace probeci::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;

/// Keys are kept sorted so the payload is byte-for-byte reproducible.
using JsonObject = std::map<std::string, JsonValue>;

/// A report value. Containers are boxed, so values are move-only.
struct JsonValue {
    using Null = std::monostate;
    using Storage = std::variant<Null, bool, std::string, Box<JsonArray>, Box<JsonObject>>;

    Storage data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
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

    // Accessors throw `std::bad_variant_access` when the kind does not match.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Field lookup; `nullptr` when missing or when this is not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            return it == (*obj)->end() ? nullptr : &it->second;
        }
        return nullptr;
    }

    /// Element or field count; zero for scalars.
    [[nodiscard]] auto size() const -> size_t {
        if (is_array()) {
            return as_array().size();
        }
        if (is_object()) {
            return as_object().size();
        }
        return 0;
    }

    void push(JsonValue value) {
        std::get<Box<JsonArray>>(data)->push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        (*std::get<Box<JsonObject>>(data))[key] = std::move(value);
    }

    /// Compact JSON text with no whitespace between tokens.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Escapes `s` for a JSON string literal, without the surrounding quotes.
[[nodiscard]] auto escape_string(std::string_view s) -> std::string;

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace probeci::json
