//! # Syntax Tree
//!
//! This module defines the lossless syntax tree produced by the parser and
//! read by the formatter and the query service.
//!
//! ## Architecture
//!
//! Three layers, leaves first:
//!
//! - **Token**: a terminal (see `lexer/token.hpp`)
//! - **Leaf**: a non-empty token sequence forming one grammatical unit with
//!   no exposed substructure (a quoted argument is `"` + text + `"`)
//! - **Nodes**: `Arguments` (a parenthesized list, possibly nested),
//!   `CommandInvocation` and the top-level `File`
//!
//! Children of `Arguments` and `File` are closed `std::variant` sums, so
//! every consumer handles each alternative explicitly.
//!
//! ## Ownership Model
//!
//! The tree is built bottom-up in one parse pass and owned by the caller.
//! Nested argument lists are owned via `Box<Arguments>`. Nothing is mutated
//! after construction and there are no parent pointers.
//!
//! ## Lossless Text
//!
//! Whitespace, newlines and comments are ordinary children. For any tree
//! returned by the parser, `file.text()` equals the parsed source exactly.

#ifndef CMSCRIPT_PARSER_AST_HPP
#define CMSCRIPT_PARSER_AST_HPP

#include "common.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cmscript::parser {

using lexer::Token;
using lexer::TokenKind;

// ============================================================================
// Leaves
// ============================================================================

/// The grammatical role of a Leaf.
enum class LeafKind : uint8_t {
    BracketArgument,  ///< `[==[ ... ]==]`
    QuotedArgument,   ///< `"..."`
    UnquotedArgument, ///< `foo`, `${VAR}/bin`
    BracketComment,   ///< `#[[ ... ]]`
    LineComment,      ///< `# ...` up to the line terminator
};

[[nodiscard]] auto leaf_kind_to_string(LeafKind kind) -> std::string_view;

/// A token sequence that forms one argument or comment.
///
/// Invariant: `tokens` is never empty.
struct Leaf {
    LeafKind kind;
    std::vector<Token> tokens;

    [[nodiscard]] auto start() const -> size_t {
        return tokens.front().pos;
    }

    [[nodiscard]] auto end() const -> size_t {
        return tokens.back().end();
    }

    /// Concatenated token text.
    [[nodiscard]] auto text() const -> std::string;

    /// The body between the delimiters.
    ///
    /// For `#[==[text]==]` this is `text`, for `"a b"` it is `a b`, for a
    /// line comment the text after `#`, for an unquoted argument its text.
    /// Escape sequences are not decoded.
    [[nodiscard]] auto content() const -> std::string_view;

    [[nodiscard]] auto is_argument() const -> bool {
        return kind == LeafKind::BracketArgument || kind == LeafKind::QuotedArgument ||
               kind == LeafKind::UnquotedArgument;
    }

    [[nodiscard]] auto is_comment() const -> bool {
        return kind == LeafKind::BracketComment || kind == LeafKind::LineComment;
    }
};

// ============================================================================
// Argument Lists
// ============================================================================

struct Arguments;

/// Owning pointer to a nested (grouped) argument list.
using ArgumentsPtr = Box<Arguments>;

/// One child of an argument list.
///
/// - `Token`: `(`, `)`, Space or Newline
/// - `Leaf`: an argument or a comment
/// - `ArgumentsPtr`: a grouped list such as `(b c)` in `cmd(a (b c) d)`
struct ArgElement {
    std::variant<Token, Leaf, ArgumentsPtr> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    /// True for a token of kind `k`.
    [[nodiscard]] auto is_token(TokenKind k) const -> bool;

    /// True for argument leaves and grouped lists.
    [[nodiscard]] auto is_argument() const -> bool;

    [[nodiscard]] auto start() const -> size_t;
    [[nodiscard]] auto end() const -> size_t;
    void append_text(std::string& out) const;
};

/// A parenthesized argument list, from `(` to the matching `)`.
///
/// `grouped` is set for lists nested inside another list. Both kinds share
/// one representation so the same rules apply at every depth.
struct Arguments {
    bool grouped = false;
    std::vector<ArgElement> children;

    /// Offset of the first child, empty for a list with no children.
    [[nodiscard]] auto start() const -> std::optional<size_t>;

    /// Offset one past the last child, empty for a list with no children.
    [[nodiscard]] auto end() const -> std::optional<size_t>;

    [[nodiscard]] auto text() const -> std::string;
    void append_text(std::string& out) const;

    /// The argument-bearing children in order: argument leaves and grouped
    /// lists. Parentheses, separators and comments are skipped.
    [[nodiscard]] auto arguments() const -> std::vector<const ArgElement*>;
};

// ============================================================================
// Commands and Files
// ============================================================================

/// `name(arguments)` with an optional blank run before `(`.
struct CommandInvocation {
    Token identifier;
    std::optional<Token> space;
    Arguments arguments;

    [[nodiscard]] auto name() const -> std::string_view {
        return identifier.text;
    }

    [[nodiscard]] auto start() const -> size_t {
        return identifier.pos;
    }

    [[nodiscard]] auto end() const -> size_t;

    [[nodiscard]] auto text() const -> std::string;
    void append_text(std::string& out) const;
};

/// One child of a File.
///
/// - `Token`: Space, Newline or the final zero-width Eof
/// - `Leaf`: a comment
/// - `CommandInvocation`
struct FileElement {
    std::variant<Token, Leaf, CommandInvocation> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    [[nodiscard]] auto is_token(TokenKind k) const -> bool;

    [[nodiscard]] auto start() const -> size_t;
    [[nodiscard]] auto end() const -> size_t;
    void append_text(std::string& out) const;
};

/// A whole script. The last child of a parsed File is the Eof token.
struct File {
    std::vector<FileElement> children;

    [[nodiscard]] auto start() const -> std::optional<size_t>;
    [[nodiscard]] auto end() const -> std::optional<size_t>;

    /// Reconstructs the source text.
    [[nodiscard]] auto text() const -> std::string;

    /// The command invocations in source order.
    [[nodiscard]] auto commands() const -> std::vector<const CommandInvocation*>;
};

// ============================================================================
// Tree Queries
// ============================================================================

/// The command under a cursor offset.
struct CursorContext {
    const CommandInvocation* command;

    /// Index into `command->arguments.arguments()`, or -1 when the cursor is
    /// on the command name, a separator or a comment.
    int argument_index;
};

/// Finds the command whose span contains `offset`.
///
/// Spans are inclusive at the end so a cursor just after `)` or just after
/// the last character of an argument still belongs to it.
[[nodiscard]] auto command_at(const File& file, size_t offset) -> std::optional<CursorContext>;

/// The tokens of the tree in source order.
///
/// Concatenating their text reproduces `file.text()`.
[[nodiscard]] auto tokens(const File& file) -> std::vector<Token>;

/// Renders the tree as an indented outline (one node per line).
[[nodiscard]] auto dump(const File& file) -> std::string;

} // namespace cmscript::parser

#endif // CMSCRIPT_PARSER_AST_HPP
