//! # JSON Builder Implementation
//!
//! `end()` pops the innermost frame and stores its value in the parent
//! object under the key the frame was opened with. Popping the last frame
//! makes it the result.

#include "json/json_builder.hpp"

#include <stdexcept>

namespace probeci::json {

namespace {

[[noreturn]] void misuse(const char* what) {
    throw std::logic_error(std::string("JsonBuilder: ") + what);
}

} // namespace

void JsonBuilder::open(JsonValue container, std::string key) {
    stack_.push(Frame{std::move(container), std::move(key)});
}

auto JsonBuilder::object() -> JsonBuilder& {
    if (!stack_.empty() || has_result_) {
        misuse("object() only opens the root");
    }
    open(json_object(), {});
    return *this;
}

auto JsonBuilder::field_array(const std::string& key) -> JsonBuilder& {
    if (stack_.empty() || !stack_.top().value.is_object()) {
        misuse("field_array() outside an object");
    }
    open(json_array(), key);
    return *this;
}

auto JsonBuilder::end() -> JsonBuilder& {
    if (stack_.empty()) {
        misuse("end() with nothing open");
    }

    Frame frame = std::move(stack_.top());
    stack_.pop();

    if (stack_.empty()) {
        result_ = std::move(frame.value);
        has_result_ = true;
    } else {
        stack_.top().value.set(frame.key, std::move(frame.value));
    }
    return *this;
}

auto JsonBuilder::field(const std::string& key, JsonValue value) -> JsonBuilder& {
    if (stack_.empty() || !stack_.top().value.is_object()) {
        misuse("field() outside an object");
    }
    stack_.top().value.set(key, std::move(value));
    return *this;
}

auto JsonBuilder::field(const std::string& key, const char* value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::field(const std::string& key, const std::string& value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::field(const std::string& key, bool value) -> JsonBuilder& {
    return field(key, JsonValue(value));
}

auto JsonBuilder::item(const std::string& value) -> JsonBuilder& {
    if (stack_.empty() || !stack_.top().value.is_array()) {
        misuse("item() outside an array");
    }
    stack_.top().value.push(JsonValue(value));
    return *this;
}

auto JsonBuilder::item(const char* value) -> JsonBuilder& {
    return item(std::string(value));
}

auto JsonBuilder::build() -> JsonValue {
    if (!is_complete()) {
        misuse("build() before the root is closed");
    }
    has_result_ = false;
    return std::move(result_);
}

} // namespace probeci::json
