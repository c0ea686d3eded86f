//! # Common Definitions
//!
//! Types and helpers shared by every probeci module.
//!
//! ## Overview
//!
//! - **Version Information**: Harness version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions across modules**: Fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef PROBECI_COMMON_HPP
#define PROBECI_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace probeci {

// ============================================================================
// Version Information
// ============================================================================

/// The harness version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<std::string, HarnessError> key = read_auth_key(in, out, 20);
/// if (is_err(key)) {
///     return unwrap_err(key);
/// }
/// send(unwrap(key));
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
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace probeci

#endif // PROBECI_COMMON_HPP
