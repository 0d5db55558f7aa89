//! # CMake Script Parser
//!
//! A hand-written recursive-descent parser producing a lossless `File`
//! tree. Every terminal is consumed through the lexeme matcher, so the
//! parser has a single position register and no token buffer.
//!
//! ## Grammar
//!
//! ```text
//! File        = FileElement* EOF
//! FileElement = Command | Comment | Newline | Space | EOF
//! Command     = Identifier Space? Arguments
//! Arguments   = '(' Argument* ')'
//! Argument    = Arguments | Bracket | Quoted | Unquoted | Space | Newline | Comment
//! Bracket     = '[' '='{n} '[' Text? ']' '='{n} ']'
//! Quoted      = '"' Text? '"'
//! Comment     = '#' (Bracket | Text?)
//! ```
//!
//! Alternatives are tried in the order written: the first production that
//! matches wins. A production that does not apply consumes nothing.
//!
//! ## Errors
//!
//! There is no recovery. The first missing terminal ends the parse with a
//! `ParseError` carrying the offset and its 1-based row/column.
//!
//! | Code | Meaning                               |
//! |------|---------------------------------------|
//! | P001 | no file element matches               |
//! | P002 | missing `(` after a command name      |
//! | P003 | missing `)` closing an argument list  |
//! | P004 | missing `"` closing a quoted argument |
//! | P005 | missing `]=*]` closing a bracket      |
//! | P006 | argument lists nested too deeply      |

#ifndef CMSCRIPT_PARSER_PARSER_HPP
#define CMSCRIPT_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/matcher.hpp"
#include "parser/ast.hpp"

#include <string>
#include <string_view>

namespace cmscript::parser {

/// A syntax error.
struct ParseError {
    std::string code;    ///< "P001" .. "P006"
    std::string message; ///< Human-readable description
    size_t offset;       ///< Failure offset in the source
    TextPos pos;         ///< 1-based row/column of `offset`

    /// "row:col: message"
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Parses one script.
///
/// The parser borrows `source`; the text must outlive the `parse()` call.
/// The returned tree owns copies of all token text.
class Parser {
public:
    explicit Parser(std::string_view source);

    /// Parses the whole input.
    [[nodiscard]] auto parse() -> Result<File, ParseError>;

    /// Deepest argument-list nesting accepted, counting the command's own list.
    static constexpr size_t MAX_ARGUMENT_DEPTH = 512;

private:
    lexer::Matcher matcher_;
    size_t depth_ = 0; ///< Argument lists currently open

    /// Result of a production that may not apply: `std::nullopt` means
    /// "try the next alternative", an error ends the parse.
    template <typename T> using Production = Result<std::optional<T>, ParseError>;

    // Structure (parser_core.cpp)
    auto parse_file_element() -> Result<FileElement, ParseError>;
    auto parse_command() -> Production<CommandInvocation>;
    auto parse_arguments(bool grouped) -> Production<Arguments>;
    auto parse_argument() -> Production<ArgElement>;
    auto parse_token(const std::regex& pattern, TokenKind kind) -> std::optional<Token>;
    auto parse_literal(std::string_view literal, TokenKind kind) -> std::optional<Token>;
    static auto token_of(std::optional<lexer::Match> match, TokenKind kind) -> std::optional<Token>;

    // Leaves (parser_leaves.cpp)
    auto parse_bracket(LeafKind kind, std::vector<Token> prefix) -> Production<Leaf>;
    auto parse_quoted() -> Production<Leaf>;
    auto parse_unquoted() -> std::optional<Leaf>;
    auto parse_comment() -> Production<Leaf>;

    /// Error at the current offset.
    [[nodiscard]] auto error(std::string code, std::string message) const -> ParseError;
    [[nodiscard]] auto error_at(size_t offset, std::string code, std::string message) const
        -> ParseError;
    [[nodiscard]] auto position_of(size_t offset) const -> std::string;
};

/// Convenience wrapper: `Parser(source).parse()`.
[[nodiscard]] auto parse(std::string_view source) -> Result<File, ParseError>;

} // namespace cmscript::parser

#endif // CMSCRIPT_PARSER_PARSER_HPP
