//! # UTF-8 Lossy Decoding
//!
//! Child processes write arbitrary bytes to their output streams. Before the
//! captured text goes into a JSON payload it is decoded permissively: every
//! maximal invalid byte sequence becomes one U+FFFD replacement character,
//! valid sequences are copied unchanged.
//!
//! ## Usage
//!
//! ```cpp
//! #include "common/utf8.hpp"
//!
//! std::string text = probeci::utf8_lossy(raw_bytes);
//! ```

#ifndef PROBECI_COMMON_UTF8_HPP
#define PROBECI_COMMON_UTF8_HPP

#include <string>
#include <string_view>

namespace probeci {

/// UTF-8 encoding of U+FFFD REPLACEMENT CHARACTER.
inline constexpr std::string_view UTF8_REPLACEMENT = "\xEF\xBF\xBD";

/// Decodes `bytes` as UTF-8, replacing invalid sequences with U+FFFD.
[[nodiscard]] auto utf8_lossy(std::string_view bytes) -> std::string;

/// Returns `true` if `bytes` is entirely well-formed UTF-8.
[[nodiscard]] auto is_valid_utf8(std::string_view bytes) -> bool;

} // namespace probeci

#endif // PROBECI_COMMON_UTF8_HPP
