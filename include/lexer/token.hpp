//! # Token Definitions
//!
//! Tokens are the terminals of the CMake script grammar. Unlike most
//! language front ends, whitespace and newlines are tokens too: the syntax
//! tree keeps every byte of the input so that `text()` reconstructs it
//! exactly.
//!
//! ## Token Categories
//!
//! | Kind          | Example text   | Produced by                          |
//! |---------------|----------------|--------------------------------------|
//! | `Eof`         | (empty)        | end of input                         |
//! | `Identifier`  | `add_library`  | command names                        |
//! | `Text`        | `foo`, `a b`   | argument and comment bodies          |
//! | `Newline`     | `\n`, `\r\n`   | line terminators                     |
//! | `Space`       | ` `, `\t`      | runs of blanks                       |
//! | `LParen`      | `(`            | argument list open                   |
//! | `RParen`      | `)`            | argument list close                  |
//! | `LBracket`    | `[==[`         | bracket argument/comment open        |
//! | `RBracket`    | `]==]`         | bracket argument/comment close       |
//! | `Quote`       | `"`            | quoted argument delimiters           |
//! | `CommentMark` | `#`            | comment start                        |

#ifndef CMSCRIPT_LEXER_TOKEN_HPP
#define CMSCRIPT_LEXER_TOKEN_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cmscript::lexer {

/// The kind of a terminal in the script grammar.
enum class TokenKind : uint8_t {
    Eof,
    Identifier,
    Text,
    Newline,
    Space,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Quote,
    CommentMark,
};

/// Returns the display name of a token kind (e.g. "Identifier").
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// An immutable terminal: start offset, kind and the literal text.
///
/// Tokens own their text so a syntax tree stays valid after the source
/// buffer it was parsed from goes away.
struct Token {
    /// Offset of the first byte in the source.
    size_t pos;

    TokenKind kind;

    /// Exact source text.
    std::string text;

    /// Offset one past the last byte.
    [[nodiscard]] auto end() const -> size_t {
        return pos + text.size();
    }

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] auto operator==(const Token& other) const -> bool = default;
};

} // namespace cmscript::lexer

#endif // CMSCRIPT_LEXER_TOKEN_HPP
