//! # Debug Commands
//!
//! `cmscript lex` and `cmscript parse` print what the parser saw, for
//! debugging grammar issues.
//!
//! ```bash
//! cmscript lex CMakeLists.txt     # One token per line: row:col Kind "text"
//! cmscript parse CMakeLists.txt   # Indented tree outline
//! ```
//!
//! Tokens are only produced as part of a parse, so both commands fail on
//! syntax errors.

#include "cmd_debug.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <iostream>
#include <optional>

namespace cmscript::cli {

/// Loads and parses `path`, emitting diagnostics on failure.
static std::optional<parser::File> load_tree(const std::string& path, lexer::Source* out_source) {
    auto& diag = get_diagnostic_emitter();

    auto loaded = lexer::Source::from_file(path);
    if (is_err(loaded)) {
        diag.error(ErrorCodes::FILE_NOT_FOUND, unwrap_err(loaded));
        return std::nullopt;
    }
    *out_source = std::move(unwrap(loaded));

    auto result = parser::parse(out_source->content());
    if (is_err(result)) {
        diag.syntax_error(path, out_source->content(), unwrap_err(result));
        return std::nullopt;
    }
    return std::move(unwrap(result));
}

/// Escapes control characters and quotes for one-line output.
static std::string escape(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        default:
            out += c;
        }
    }
    return out;
}

int run_lex(const std::string& path) {
    lexer::Source source("", "");
    auto file = load_tree(path, &source);
    if (!file) {
        return ExitCode::Failure;
    }

    auto tokens = parser::tokens(*file);
    for (const auto& token : tokens) {
        auto pos = source.position(token.pos);
        std::cout << pos.row << ":" << pos.col << " " << lexer::token_kind_to_string(token.kind)
                  << " \"" << escape(token.text) << "\"\n";
    }

    CMSCRIPT_LOG_INFO("lexer", "Lexed " << tokens.size() << " tokens from " << path);
    return ExitCode::Ok;
}

int run_parse(const std::string& path) {
    lexer::Source source("", "");
    auto file = load_tree(path, &source);
    if (!file) {
        return ExitCode::Failure;
    }

    std::cout << parser::dump(*file) << "\n";

    CMSCRIPT_LOG_INFO("parser", "Parsed " << file->commands().size() << " commands from "
                                          << path);
    return ExitCode::Ok;
}

} // namespace cmscript::cli
