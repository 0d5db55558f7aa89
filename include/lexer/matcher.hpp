//! # Lexeme Matcher
//!
//! The matcher is the only primitive the grammar parser uses to consume
//! input. It holds one cursor over an immutable source view and tries to
//! match a pattern *anchored at the cursor*: a pattern that would only match
//! further ahead is a miss, so invalid bytes can never be skipped silently.
//!
//! ## Contract
//!
//! - On success the cursor moves past the match and the match is returned
//! - On failure the cursor is unchanged and `std::nullopt` is returned
//! - Misses are never errors; the parser decides when a miss is fatal
//!
//! `eat()` suits short terminals. Bodies that can run for thousands of bytes
//! (quoted text, unquoted arguments, comments) go through `eat_scan()` or
//! `eat_while()`: `std::regex` recurses once per repeated character and
//! overflows the stack on long input.
//!
//! ## Example
//!
//! ```cpp
//! static const std::regex ident(R"([A-Za-z_][A-Za-z0-9_]*)");
//! Matcher m("project(demo)");
//! auto name = m.eat(ident);    // {pos = 0, text = "project"}
//! auto open = m.eat_literal("("); // {pos = 7, text = "("}
//! ```

#ifndef CMSCRIPT_LEXER_MATCHER_HPP
#define CMSCRIPT_LEXER_MATCHER_HPP

#include <algorithm>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace cmscript::lexer {

/// A successful match: its start offset and the matched text.
struct Match {
    size_t pos;
    std::string text;

    [[nodiscard]] auto end() const -> size_t {
        return pos + text.size();
    }
};

/// Cursor-anchored matcher over a borrowed source view.
///
/// The viewed text must outlive the matcher.
class Matcher {
public:
    explicit Matcher(std::string_view source) : source_(source) {}

    /// Matches `pattern` starting exactly at the cursor.
    ///
    /// Zero-length matches are allowed (the end-of-input pattern relies on
    /// them) and leave the cursor in place.
    [[nodiscard]] auto eat(const std::regex& pattern) -> std::optional<Match>;

    /// Matches the exact text `literal` at the cursor.
    [[nodiscard]] auto eat_literal(std::string_view literal) -> std::optional<Match>;

    /// Consumes everything before the next occurrence of `terminator`.
    ///
    /// The terminator itself is not consumed. Returns `std::nullopt` (and
    /// consumes nothing) if the terminator does not occur in the rest of the
    /// input. The returned text may be empty.
    [[nodiscard]] auto eat_until(std::string_view terminator) -> std::optional<Match>;

    /// Consumes the lexeme measured by `scan`.
    ///
    /// `scan` receives the unconsumed input and returns the length of the
    /// lexeme at its start. A length of 0 is a miss.
    template <typename Scan> [[nodiscard]] auto eat_scan(Scan&& scan) -> std::optional<Match> {
        auto rest = remaining();
        size_t length = std::min<size_t>(scan(rest), rest.size());
        if (length == 0) {
            return std::nullopt;
        }
        return advance(length);
    }

    /// Consumes a non-empty run of bytes for which `pred(byte)` holds.
    template <typename Pred> [[nodiscard]] auto eat_while(Pred&& pred) -> std::optional<Match> {
        return eat_scan([&pred](std::string_view rest) {
            size_t length = 0;
            while (length < rest.size() && pred(rest[length])) {
                length++;
            }
            return length;
        });
    }

    /// Current cursor offset.
    [[nodiscard]] auto offset() const -> size_t {
        return offset_;
    }

    [[nodiscard]] auto at_end() const -> bool {
        return offset_ >= source_.size();
    }

    /// Unconsumed input.
    [[nodiscard]] auto remaining() const -> std::string_view {
        return source_.substr(offset_);
    }

    [[nodiscard]] auto source() const -> std::string_view {
        return source_;
    }

private:
    std::string_view source_;
    size_t offset_ = 0;

    auto advance(size_t length) -> Match;
};

} // namespace cmscript::lexer

#endif // CMSCRIPT_LEXER_MATCHER_HPP
