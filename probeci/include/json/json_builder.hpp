//! # JSON Builder
//!
//! Chained construction of a report document. Open containers sit on a
//! stack until `end()` attaches them to their parent.
//!
//! ```cpp
//! auto json = JsonBuilder()
//!     .object()
//!         .field("build", true)
//!         .field_array("features")
//!             .item("fona")
//!         .end()
//!     .end()
//!     .build();
//! // {"build":true,"features":["fona"]}
//! ```

#pragma once

#include "json/json_value.hpp"

#include <stack>
#include <string>

namespace probeci::json {

/// Builds one document. Misuse throws `std::logic_error`: a field outside an
/// object, an item outside an array, an unbalanced `end()`, or `build()`
/// before the root is closed.
class JsonBuilder {
public:
    JsonBuilder() = default;

    /// Opens the root object.
    auto object() -> JsonBuilder&;

    /// Closes the innermost open container.
    auto end() -> JsonBuilder&;

    auto field(const std::string& key, JsonValue value) -> JsonBuilder&;
    auto field(const std::string& key, const char* value) -> JsonBuilder&;
    auto field(const std::string& key, const std::string& value) -> JsonBuilder&;
    auto field(const std::string& key, bool value) -> JsonBuilder&;

    /// Opens an array stored under `key` once it is closed.
    auto field_array(const std::string& key) -> JsonBuilder&;

    auto item(const char* value) -> JsonBuilder&;
    auto item(const std::string& value) -> JsonBuilder&;

    /// Hands out the finished document and resets the builder.
    [[nodiscard]] auto build() -> JsonValue;

    [[nodiscard]] auto is_complete() const -> bool {
        return stack_.empty() && has_result_;
    }

private:
    struct Frame {
        JsonValue value;
        std::string key;
    };

    void open(JsonValue container, std::string key);

    std::stack<Frame> stack_;
    JsonValue result_;
    bool has_result_ = false;
};

} // namespace probeci::json
