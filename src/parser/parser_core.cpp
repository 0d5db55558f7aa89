//! # Parser Core
//!
//! File, command and argument-list productions. Leaf productions
//! (brackets, quoted and unquoted arguments, comments) live in
//! `parser_leaves.cpp`.
//!
//! Each production builds its children in a local vector and moves them
//! into the node only once the node is complete.

#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <cctype>
#include <cstdio>

namespace cmscript::parser {

namespace {

const std::regex NEWLINE_PATTERN(R"(\r?\n)");

auto is_blank(char c) -> bool {
    return c == ' ' || c == '\t';
}

/// `[A-Za-z_][A-Za-z0-9_]*`
auto scan_identifier(std::string_view rest) -> size_t {
    auto is_start = [](char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; };
    if (rest.empty() || !is_start(rest.front())) {
        return 0;
    }
    size_t length = 1;
    while (length < rest.size() &&
           (std::isalnum(static_cast<unsigned char>(rest[length])) || rest[length] == '_')) {
        length++;
    }
    return length;
}

/// Counts one open argument list for the lifetime of a production.
class DepthGuard {
public:
    explicit DepthGuard(size_t& depth) : depth_(depth) {
        depth_++;
    }
    ~DepthGuard() {
        depth_--;
    }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    size_t& depth_;
};

/// Describes the byte at the failure point for "unexpected ..." messages.
auto describe_byte(std::string_view rest) -> std::string {
    if (rest.empty()) {
        return "end of input";
    }
    auto c = static_cast<unsigned char>(rest.front());
    if (c == '\r') {
        return "carriage return";
    }
    if (std::isprint(c)) {
        return std::string("'") + static_cast<char>(c) + "'";
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", c);
    return std::string("byte ") + buf;
}

} // namespace

auto ParseError::to_string() const -> std::string {
    return std::to_string(pos.row) + ":" + std::to_string(pos.col) + ": " + message;
}

Parser::Parser(std::string_view source) : matcher_(source) {}

auto Parser::error(std::string code, std::string message) const -> ParseError {
    return error_at(matcher_.offset(), std::move(code), std::move(message));
}

auto Parser::error_at(size_t offset, std::string code, std::string message) const -> ParseError {
    return ParseError{.code = std::move(code),
                      .message = std::move(message),
                      .offset = offset,
                      .pos = lexer::rowcol(matcher_.source(), offset)};
}

auto Parser::position_of(size_t offset) const -> std::string {
    auto pos = lexer::rowcol(matcher_.source(), offset);
    return std::to_string(pos.row) + ":" + std::to_string(pos.col);
}

auto Parser::token_of(std::optional<lexer::Match> match, TokenKind kind) -> std::optional<Token> {
    if (!match) {
        return std::nullopt;
    }
    return Token{.pos = match->pos, .kind = kind, .text = std::move(match->text)};
}

auto Parser::parse_token(const std::regex& pattern, TokenKind kind) -> std::optional<Token> {
    return token_of(matcher_.eat(pattern), kind);
}

auto Parser::parse_literal(std::string_view literal, TokenKind kind) -> std::optional<Token> {
    return token_of(matcher_.eat_literal(literal), kind);
}

// ============================================================================
// File
// ============================================================================

auto Parser::parse() -> Result<File, ParseError> {
    std::vector<FileElement> children;

    while (true) {
        auto element = parse_file_element();
        if (is_err(element)) {
            auto& err = unwrap_err(element);
            CMSCRIPT_LOG_DEBUG("parse", "syntax error " << err.code << " at " << err.to_string());
            return std::move(err);
        }

        bool done = unwrap(element).is_token(TokenKind::Eof);
        children.push_back(std::move(unwrap(element)));
        if (done) {
            break;
        }
    }

    CMSCRIPT_LOG_TRACE("parse", "parsed " << children.size() << " file elements");
    return File{.children = std::move(children)};
}

auto Parser::parse_file_element() -> Result<FileElement, ParseError> {
    auto command = parse_command();
    if (is_err(command)) {
        return std::move(unwrap_err(command));
    }
    if (auto& value = unwrap(command)) {
        return FileElement{std::move(*value)};
    }

    auto comment = parse_comment();
    if (is_err(comment)) {
        return std::move(unwrap_err(comment));
    }
    if (auto& value = unwrap(comment)) {
        return FileElement{std::move(*value)};
    }

    if (auto newline = parse_token(NEWLINE_PATTERN, TokenKind::Newline)) {
        return FileElement{std::move(*newline)};
    }
    if (auto space = token_of(matcher_.eat_while(is_blank), TokenKind::Space)) {
        return FileElement{std::move(*space)};
    }

    // Zero-width end of input, tried last so real content is consumed first.
    if (matcher_.at_end()) {
        return FileElement{Token{.pos = matcher_.offset(), .kind = TokenKind::Eof, .text = ""}};
    }

    return error("P001", "unexpected " + describe_byte(matcher_.remaining()) +
                             ", expected a command, a comment or a newline");
}

// ============================================================================
// Commands
// ============================================================================

auto Parser::parse_command() -> Production<CommandInvocation> {
    auto identifier = token_of(matcher_.eat_scan(scan_identifier), TokenKind::Identifier);
    if (!identifier) {
        return std::nullopt;
    }

    auto space = token_of(matcher_.eat_while(is_blank), TokenKind::Space);

    auto arguments = parse_arguments(false);
    if (is_err(arguments)) {
        return std::move(unwrap_err(arguments));
    }
    auto& args = unwrap(arguments);
    if (!args) {
        return error("P002", "expected '(' after command name '" + identifier->text + "', found " +
                                 describe_byte(matcher_.remaining()));
    }

    CMSCRIPT_LOG_TRACE("parse", "command '" << identifier->text << "' at "
                                            << position_of(identifier->pos));
    return CommandInvocation{
        .identifier = std::move(*identifier), .space = std::move(space), .arguments = std::move(*args)};
}

// ============================================================================
// Arguments
// ============================================================================

auto Parser::parse_arguments(bool grouped) -> Production<Arguments> {
    auto open = parse_literal("(", TokenKind::LParen);
    if (!open) {
        return std::nullopt;
    }
    auto open_pos = open->pos;
    if (depth_ >= MAX_ARGUMENT_DEPTH) {
        return error_at(open_pos, "P006",
                        "argument lists nested deeper than " + std::to_string(MAX_ARGUMENT_DEPTH));
    }
    DepthGuard guard(depth_);

    std::vector<ArgElement> children;
    children.push_back(ArgElement{std::move(*open)});

    while (true) {
        auto argument = parse_argument();
        if (is_err(argument)) {
            return std::move(unwrap_err(argument));
        }
        auto& value = unwrap(argument);
        if (!value) {
            break;
        }
        children.push_back(std::move(*value));
    }

    auto close = parse_literal(")", TokenKind::RParen);
    if (!close) {
        return error("P003", "expected ')' to close '(' opened at " + position_of(open_pos) +
                                 ", found " + describe_byte(matcher_.remaining()));
    }
    children.push_back(ArgElement{std::move(*close)});

    return Arguments{.grouped = grouped, .children = std::move(children)};
}

auto Parser::parse_argument() -> Production<ArgElement> {
    auto group = parse_arguments(true);
    if (is_err(group)) {
        return std::move(unwrap_err(group));
    }
    if (auto& value = unwrap(group)) {
        return ArgElement{make_box<Arguments>(std::move(*value))};
    }

    auto bracket = parse_bracket(LeafKind::BracketArgument, {});
    if (is_err(bracket)) {
        return std::move(unwrap_err(bracket));
    }
    if (auto& value = unwrap(bracket)) {
        return ArgElement{std::move(*value)};
    }

    auto quoted = parse_quoted();
    if (is_err(quoted)) {
        return std::move(unwrap_err(quoted));
    }
    if (auto& value = unwrap(quoted)) {
        return ArgElement{std::move(*value)};
    }

    if (auto unquoted = parse_unquoted()) {
        return ArgElement{std::move(*unquoted)};
    }
    if (auto space = token_of(matcher_.eat_while(is_blank), TokenKind::Space)) {
        return ArgElement{std::move(*space)};
    }
    if (auto newline = parse_token(NEWLINE_PATTERN, TokenKind::Newline)) {
        return ArgElement{std::move(*newline)};
    }

    auto comment = parse_comment();
    if (is_err(comment)) {
        return std::move(unwrap_err(comment));
    }
    if (auto& value = unwrap(comment)) {
        return ArgElement{std::move(*value)};
    }

    // End of the argument list; the caller expects ')'.
    return std::nullopt;
}

auto parse(std::string_view source) -> Result<File, ParseError> {
    return Parser(source).parse();
}

} // namespace cmscript::parser
