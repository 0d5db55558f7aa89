//! # Shared Vocabulary
//!
//! Types used across the lexeme matcher, parser, formatter, query service
//! and command line driver.
//!
//! Errors are values: operations that can fail return `Result<T, E>`, a
//! variant holding either the value or the error, and callers test it with
//! `is_ok()` / `is_err()` before calling `unwrap()` / `unwrap_err()`.
//!
//! Positions are stored as byte offsets. `TextPos` is derived from an
//! offset when a human needs to see it.

#ifndef CMSCRIPT_COMMON_HPP
#define CMSCRIPT_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cmscript {

/// Version printed by `cmscript --version`.
constexpr const char* VERSION = "0.3.0";

/// Flags the driver sets once, before any command runs. Only CLI output
/// reads them.
struct Options {
    static inline bool verbose = false; ///< Per-file progress lines
    static inline bool color = true;    ///< ANSI colors on stderr
};

/// A 1-based row and column. `col - 1` is the number of bytes between the
/// start of the line and the position.
struct TextPos {
    uint32_t row = 1;
    uint32_t col = 1;

    [[nodiscard]] auto operator==(const TextPos& other) const -> bool = default;
};

// ============================================================================
// Result
// ============================================================================

template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// The value of an ok Result; `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// The error of a failed Result; `std::bad_variant_access` on a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

// ============================================================================
// Ownership
// ============================================================================

/// Owning pointer for tree nodes.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Lets `static_assert` reject an unhandled alternative in a
/// `std::visit` + `if constexpr` chain.
template <typename> inline constexpr bool always_false_v = false;

} // namespace cmscript

#endif // CMSCRIPT_COMMON_HPP
