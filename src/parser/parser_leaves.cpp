//! # Parser Leaves
//!
//! Bracket, quoted and unquoted arguments and comments.
//!
//! ## Bracket Closing
//!
//! The closer of `[==[` is exactly `]==]`: the number of `=` signs must
//! match. A `]` or a closer with a different count inside the body is body
//! text, so `#[==[a]=]b]==]` is one comment with body `a]=]b`, and
//! `#[==[text]=]` at end of input is unterminated.

#include "lexer/source.hpp"
#include "parser/parser.hpp"

#include <cctype>

namespace cmscript::parser {

namespace {

const std::regex BRACKET_OPEN_PATTERN(R"(\[=*\[)");

auto is_unquoted_byte(char c) -> bool {
    auto byte = static_cast<unsigned char>(c);
    return !std::isspace(byte) && std::string_view("()#\"\\").find(c) == std::string_view::npos;
}

/// Bytes a backslash may escape in an unquoted argument: punctuation and
/// other non-alphanumerics, plus t, r, n and ;.
auto is_unquoted_escape(char c) -> bool {
    return !std::isalnum(static_cast<unsigned char>(c)) || c == 't' || c == 'r' || c == 'n';
}

/// Quoted body: any byte but '"' or '\', or a backslash escape of any byte
/// (newlines included, which CMake treats as a line continuation). A lone
/// trailing backslash ends the body.
auto scan_quoted_text(std::string_view rest) -> size_t {
    size_t length = 0;
    while (length < rest.size() && rest[length] != '"') {
        if (rest[length] == '\\') {
            if (length + 1 == rest.size()) {
                break;
            }
            length++;
        }
        length++;
    }
    return length;
}

/// Unquoted argument: bytes other than whitespace and ( ) # " \, and
/// escapes. Variable references and generator expressions pass through as
/// plain text.
auto scan_unquoted(std::string_view rest) -> size_t {
    size_t length = 0;
    while (length < rest.size()) {
        if (is_unquoted_byte(rest[length])) {
            length++;
        } else if (rest[length] == '\\' && length + 1 < rest.size() &&
                   is_unquoted_escape(rest[length + 1])) {
            length += 2;
        } else {
            break;
        }
    }
    return length;
}

auto is_comment_byte(char c) -> bool {
    return c != '\r' && c != '\n';
}

} // namespace

auto Parser::parse_bracket(LeafKind kind, std::vector<Token> prefix) -> Production<Leaf> {
    auto open = matcher_.eat(BRACKET_OPEN_PATTERN);
    if (!open) {
        return std::nullopt;
    }

    std::string close = "]" + std::string(open->text.size() - 2, '=') + "]";
    auto open_pos = open->pos;
    std::vector<Token> tokens = std::move(prefix);
    tokens.push_back(Token{.pos = open->pos, .kind = TokenKind::LBracket, .text = open->text});

    auto body = matcher_.eat_until(close);
    if (!body) {
        return error_at(matcher_.source().size(), "P005",
                        "unterminated bracket: expected '" + close + "' to close '" + open->text +
                            "' opened at " + position_of(open_pos));
    }
    if (!body->text.empty()) {
        tokens.push_back(Token{.pos = body->pos, .kind = TokenKind::Text, .text = body->text});
    }

    auto closer = matcher_.eat_literal(close);
    tokens.push_back(Token{.pos = closer->pos, .kind = TokenKind::RBracket, .text = closer->text});

    return Leaf{.kind = kind, .tokens = std::move(tokens)};
}

auto Parser::parse_quoted() -> Production<Leaf> {
    auto open = parse_literal("\"", TokenKind::Quote);
    if (!open) {
        return std::nullopt;
    }
    auto open_pos = open->pos;

    std::vector<Token> tokens;
    tokens.push_back(std::move(*open));

    if (auto text = token_of(matcher_.eat_scan(scan_quoted_text), TokenKind::Text)) {
        tokens.push_back(std::move(*text));
    }

    auto close = parse_literal("\"", TokenKind::Quote);
    if (!close) {
        return error("P004", "expected '\"' to close quoted argument opened at " +
                                 position_of(open_pos));
    }
    tokens.push_back(std::move(*close));

    return Leaf{.kind = LeafKind::QuotedArgument, .tokens = std::move(tokens)};
}

auto Parser::parse_unquoted() -> std::optional<Leaf> {
    auto text = token_of(matcher_.eat_scan(scan_unquoted), TokenKind::Text);
    if (!text) {
        return std::nullopt;
    }
    std::vector<Token> tokens;
    tokens.push_back(std::move(*text));
    return Leaf{.kind = LeafKind::UnquotedArgument, .tokens = std::move(tokens)};
}

auto Parser::parse_comment() -> Production<Leaf> {
    auto mark = parse_literal("#", TokenKind::CommentMark);
    if (!mark) {
        return std::nullopt;
    }

    std::vector<Token> tokens;
    tokens.push_back(std::move(*mark));

    auto bracket = parse_bracket(LeafKind::BracketComment, tokens);
    if (is_err(bracket)) {
        return std::move(unwrap_err(bracket));
    }
    if (auto& value = unwrap(bracket)) {
        return std::move(*value);
    }

    // `#` alone or `#[` without a second `[` starts a line comment.
    auto text = token_of(matcher_.eat_while(is_comment_byte), TokenKind::Text);
    tokens.push_back(text ? std::move(*text)
                          : Token{.pos = matcher_.offset(), .kind = TokenKind::Text, .text = ""});
    return Leaf{.kind = LeafKind::LineComment, .tokens = std::move(tokens)};
}

} // namespace cmscript::parser
