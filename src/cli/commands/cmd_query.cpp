//! # Query Commands
//!
//! Thin command line wrappers over `query::Script`.
//!
//! ## Output
//!
//! | Command    | Output                                  | No result |
//! |------------|-----------------------------------------|-----------|
//! | `word`     | the word                                | exit 1    |
//! | `scope`    | `<kind>\t<prefix>`                      | `unknown` |
//! | `complete` | `<name>\t<kind>` per candidate          | no lines  |
//! | `help`     | `<kind> <name>` then the cmake help     | exit 1    |
//! | `context`  | `<command>\t<index>[\t<argument>]`      | exit 1    |
//!
//! `complete` keeps only candidates starting with the typed prefix
//! (case-insensitive).

#include "cmd_query.hpp"

#include "cli/diagnostic.hpp"
#include "cli/help_registry.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"
#include "query/script.hpp"

#include <cctype>
#include <iostream>
#include <optional>
#include <vector>

namespace cmscript::cli {

/// Positional arguments after the command name, without logging flags.
static std::vector<std::string> positional_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (!log::is_log_option(arg)) {
            args.push_back(std::move(arg));
        }
    }
    return args;
}

struct CursorQuery {
    query::Script script;
    query::Cursor cursor;
};

/// Loads `<file> <line> <col>`. Returns nullopt after reporting the problem
/// and setting `status`.
static std::optional<CursorQuery> load_cursor_query(int argc, char* argv[],
                                                    const char* command, int& status) {
    auto args = positional_args(argc, argv);
    if (args.size() != 3) {
        std::cerr << "Usage: cmscript " << command << " <file> <line> <col>\n";
        status = ExitCode::Usage;
        return std::nullopt;
    }

    auto line = parse_uint(args[1]);
    auto column = parse_uint(args[2]);
    if (!line || !column) {
        std::cerr << "Error: line and column must be non-negative integers\n";
        status = ExitCode::Usage;
        return std::nullopt;
    }

    auto loaded = lexer::Source::from_file(args[0]);
    if (is_err(loaded)) {
        get_diagnostic_emitter().error(ErrorCodes::FILE_NOT_FOUND, unwrap_err(loaded));
        status = ExitCode::Failure;
        return std::nullopt;
    }

    CursorQuery request{
        .script = query::Script(std::string(unwrap(loaded).content()), args[0]),
        .cursor = query::Cursor{.line = *line, .column = *column},
    };
    if (!request.script.offset_of(request.cursor)) {
        get_diagnostic_emitter().error(ErrorCodes::INVALID_CURSOR,
                                       "cursor " + args[1] + ":" + args[2] +
                                           " is outside " + args[0]);
        status = ExitCode::Failure;
        return std::nullopt;
    }
    return request;
}

static bool starts_with_ignore_case(std::string_view text, std::string_view prefix) {
    if (prefix.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

int run_word(int argc, char* argv[]) {
    int status = ExitCode::Ok;
    auto request = load_cursor_query(argc, argv, "word", status);
    if (!request) {
        return status;
    }

    auto word = request->script.word_at(request->cursor);
    if (!word) {
        CMSCRIPT_LOG_INFO("query", "No word at " << request->cursor.line << ":"
                                                 << request->cursor.column);
        return ExitCode::Failure;
    }
    std::cout << *word << "\n";
    return ExitCode::Ok;
}

int run_scope(int argc, char* argv[]) {
    int status = ExitCode::Ok;
    auto request = load_cursor_query(argc, argv, "scope", status);
    if (!request) {
        return status;
    }

    auto scope = request->script.scope_at(request->cursor);
    std::cout << query::scope_kind_to_string(scope.kind) << "\t" << scope.prefix << "\n";
    return ExitCode::Ok;
}

int run_complete(int argc, char* argv[], const query::NameRegistry& registry,
                 std::ostream& out) {
    int status = ExitCode::Ok;
    auto request = load_cursor_query(argc, argv, "complete", status);
    if (!request) {
        return status;
    }

    auto scope = request->script.scope_at(request->cursor);
    size_t shown = 0;
    for (const auto& name : request->script.complete(request->cursor, registry)) {
        if (starts_with_ignore_case(name.name, scope.prefix)) {
            out << name.name << "\t" << query::name_kind_to_string(name.kind) << "\n";
            shown++;
        }
    }

    CMSCRIPT_LOG_INFO("query", shown << " candidates for "
                                     << query::scope_kind_to_string(scope.kind) << " '"
                                     << scope.prefix << "'");
    return ExitCode::Ok;
}

int run_help(int argc, char* argv[], const CMakeHelpRegistry& registry, std::ostream& out) {
    int status = ExitCode::Ok;
    auto request = load_cursor_query(argc, argv, "help", status);
    if (!request) {
        return status;
    }

    auto name = request->script.hover(request->cursor, registry);
    if (!name) {
        CMSCRIPT_LOG_INFO("query", "No documented name at " << request->cursor.line << ":"
                                                            << request->cursor.column);
        return ExitCode::Failure;
    }

    auto doc = registry.documentation(*name);
    out << query::name_kind_to_string(name->kind) << " " << name->name << "\n";
    if (!doc) {
        return ExitCode::Failure;
    }
    out << "\n" << *doc;
    if (!doc->empty() && doc->back() != '\n') {
        out << "\n";
    }
    return ExitCode::Ok;
}

int run_context(int argc, char* argv[]) {
    auto args = positional_args(argc, argv);
    if (args.size() != 2) {
        std::cerr << "Usage: cmscript context <file> <offset>\n";
        return ExitCode::Usage;
    }
    auto offset = parse_uint(args[1]);
    if (!offset) {
        std::cerr << "Error: offset must be a non-negative integer\n";
        return ExitCode::Usage;
    }

    auto loaded = lexer::Source::from_file(args[0]);
    if (is_err(loaded)) {
        get_diagnostic_emitter().error(ErrorCodes::FILE_NOT_FOUND, unwrap_err(loaded));
        return ExitCode::Failure;
    }
    std::string content(unwrap(loaded).content());
    if (*offset > content.size()) {
        get_diagnostic_emitter().error(ErrorCodes::INVALID_CURSOR,
                                       "offset " + args[1] + " is outside " + args[0]);
        return ExitCode::Failure;
    }

    query::Script script(content, args[0]);
    auto result = script.context_at(*offset);
    if (is_err(result)) {
        auto& diag = get_diagnostic_emitter();
        diag.syntax_error(args[0], content, unwrap_err(result));
        return ExitCode::Failure;
    }

    const auto& context = unwrap(result);
    if (!context) {
        CMSCRIPT_LOG_INFO("query", "No command at offset " << *offset);
        return ExitCode::Failure;
    }

    std::cout << context->command << "\t" << context->argument_index;
    if (context->argument) {
        std::cout << "\t" << *context->argument;
    }
    std::cout << "\n";
    return ExitCode::Ok;
}

} // namespace cmscript::cli
