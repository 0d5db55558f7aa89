//! # Script Query Service
//!
//! Cursor-context helpers for editors: the identifier under the cursor, the
//! syntactic role of the cursor position, completion candidates and the
//! command/argument under the cursor.
//!
//! ## Cursors
//!
//! Editors report cursors as 0-based line and column. `Cursor` uses that
//! convention. Diagnostics use the 1-based `TextPos` instead.
//!
//! ## Scope Classification
//!
//! Completion must work on half-typed, syntactically invalid text, so the
//! role of the cursor is guessed from the text before it on the same line.
//! Patterns are case-insensitive and tried in order; the first match wins.
//!
//! | Scope     | Text before cursor ends with | Candidates                    |
//! |-----------|------------------------------|-------------------------------|
//! | `Command` | optional blanks + word       | commands                      |
//! | `Setter`  | `set(` + word                | variables, properties         |
//! | `Access`  | `${` + word                  | variables, properties         |
//! | `Include` | `include(` + word            | modules                       |
//! | `Params`  | `name(` + word               | modules, variables, properties|
//! | `Value`   | `name(arg ` ... word         | variables, properties         |
//! | `Unknown` | anything else                | none                          |

#ifndef CMSCRIPT_QUERY_SCRIPT_HPP
#define CMSCRIPT_QUERY_SCRIPT_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "parser/parser.hpp"
#include "query/names.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cmscript::query {

/// An editor cursor. Both fields are 0-based.
struct Cursor {
    uint32_t line = 0;
    uint32_t column = 0;
};

/// The syntactic role of a cursor position.
enum class ScopeKind : uint8_t {
    Command,
    Setter,
    Access,
    Include,
    Params,
    Value,
    Unknown,
};

[[nodiscard]] auto scope_kind_to_string(ScopeKind kind) -> std::string_view;

/// Result of scope classification: the role and the partial word typed so
/// far (empty for `Unknown`).
struct ScopeMatch {
    ScopeKind kind = ScopeKind::Unknown;
    std::string prefix;
};

/// Classifies the text before a cursor (same line only).
[[nodiscard]] auto classify_scope(std::string_view text_before_cursor) -> ScopeMatch;

/// Name kinds offered for completion in a scope.
[[nodiscard]] auto candidate_kinds(ScopeKind kind) -> std::vector<NameKind>;

/// The command and argument under a cursor.
struct CommandContext {
    std::string command;
    int argument_index = -1;             ///< -1 on the name or a separator
    std::optional<std::string> argument; ///< Argument text when on an argument
};

/// One script version, queried by cursor.
///
/// Queries are independent; each parse-based query parses afresh.
class Script {
public:
    explicit Script(std::string text, std::string name = "<input>");

    [[nodiscard]] auto source() const -> const lexer::Source& {
        return source_;
    }

    /// Converts a cursor to an offset.
    ///
    /// Returns `std::nullopt` if the line does not exist or the column is
    /// past the end of the line.
    [[nodiscard]] auto offset_of(Cursor cursor) const -> std::optional<size_t>;

    /// The `\w+` run on the offset's line whose span contains the offset.
    ///
    /// The span end is inclusive, so a cursor just after a word finds it.
    /// Returns `std::nullopt` on punctuation or whitespace away from words.
    [[nodiscard]] auto word_at(size_t offset) const -> std::optional<std::string>;
    [[nodiscard]] auto word_at(Cursor cursor) const -> std::optional<std::string>;

    [[nodiscard]] auto scope_at(Cursor cursor) const -> ScopeMatch;

    /// Completion candidates for the cursor's scope, in registry order.
    [[nodiscard]] auto complete(Cursor cursor, const NameRegistry& registry) const
        -> std::vector<Name>;

    /// The registry entry for the word under the cursor.
    [[nodiscard]] auto hover(Cursor cursor, const NameRegistry& registry) const
        -> std::optional<Name>;

    /// Parses the script and finds the command under `offset`.
    [[nodiscard]] auto context_at(size_t offset) const
        -> Result<std::optional<CommandContext>, parser::ParseError>;

private:
    lexer::Source source_;
};

} // namespace cmscript::query

#endif // CMSCRIPT_QUERY_SCRIPT_HPP
