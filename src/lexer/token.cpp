#include "lexer/token.hpp"

namespace cmscript::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "EOF";
    case TokenKind::Identifier:
        return "Identifier";
    case TokenKind::Text:
        return "Text";
    case TokenKind::Newline:
        return "Newline";
    case TokenKind::Space:
        return "Space";
    case TokenKind::LParen:
        return "LParen";
    case TokenKind::RParen:
        return "RParen";
    case TokenKind::LBracket:
        return "LBracket";
    case TokenKind::RBracket:
        return "RBracket";
    case TokenKind::Quote:
        return "Quote";
    case TokenKind::CommentMark:
        return "CommentMark";
    }
    return "unknown";
}

} // namespace cmscript::lexer
