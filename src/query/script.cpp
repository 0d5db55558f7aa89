//! # Script Query Service Implementation
//!
//! `word_at()` and `classify_scope()` work on raw line text and never
//! parse; only `context_at()` builds a tree.

#include "query/script.hpp"

#include "log/log.hpp"

#include <cctype>
#include <regex>

namespace cmscript::query {

namespace {

auto is_word_byte(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

struct ScopePattern {
    ScopeKind kind;
    std::regex pattern;
};

auto scope_patterns() -> const std::vector<ScopePattern>& {
    static const std::vector<ScopePattern> patterns = [] {
        auto icase = std::regex::ECMAScript | std::regex::icase;
        std::vector<ScopePattern> result;
        result.push_back({ScopeKind::Command, std::regex(R"(^\s*(\w*)$)", icase)});
        result.push_back({ScopeKind::Setter, std::regex(R"(set\((\w*)$)", icase)});
        result.push_back({ScopeKind::Access, std::regex(R"(\$\{(\w*)$)", icase)});
        result.push_back({ScopeKind::Include, std::regex(R"(include\((\w*)$)", icase)});
        result.push_back({ScopeKind::Params, std::regex(R"(\w+\((\w*)$)", icase)});
        result.push_back({ScopeKind::Value, std::regex(R"(\w+\(\w+ (?:\w+ )*(\w*)$)", icase)});
        return result;
    }();
    return patterns;
}

} // namespace

auto scope_kind_to_string(ScopeKind kind) -> std::string_view {
    switch (kind) {
    case ScopeKind::Command:
        return "command";
    case ScopeKind::Setter:
        return "setter";
    case ScopeKind::Access:
        return "access";
    case ScopeKind::Include:
        return "include";
    case ScopeKind::Params:
        return "params";
    case ScopeKind::Value:
        return "value";
    case ScopeKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

auto classify_scope(std::string_view text_before_cursor) -> ScopeMatch {
    std::string text(text_before_cursor);
    for (const auto& [kind, pattern] : scope_patterns()) {
        std::smatch match;
        if (std::regex_search(text, match, pattern)) {
            return ScopeMatch{.kind = kind, .prefix = match.str(1)};
        }
    }
    return ScopeMatch{};
}

auto candidate_kinds(ScopeKind kind) -> std::vector<NameKind> {
    switch (kind) {
    case ScopeKind::Command:
        return {NameKind::Command};
    case ScopeKind::Setter:
    case ScopeKind::Access:
    case ScopeKind::Value:
        return {NameKind::Variable, NameKind::Property};
    case ScopeKind::Include:
        return {NameKind::Module};
    case ScopeKind::Params:
        return {NameKind::Module, NameKind::Variable, NameKind::Property};
    case ScopeKind::Unknown:
        return {};
    }
    return {};
}

// ============================================================================
// Script
// ============================================================================

Script::Script(std::string text, std::string name)
    : source_(lexer::Source::from_string(std::move(text), std::move(name))) {}

auto Script::offset_of(Cursor cursor) const -> std::optional<size_t> {
    return source_.offset_of(cursor.line + 1, cursor.column + 1);
}

auto Script::word_at(size_t offset) const -> std::optional<std::string> {
    if (offset > source_.length()) {
        return std::nullopt;
    }

    auto pos = source_.position(offset);
    auto line = source_.line(pos.row);
    size_t column = pos.col - 1;

    // Walk the line's word runs; a run's span includes the offset just past it.
    size_t start = 0;
    while (start < line.size()) {
        if (!is_word_byte(line[start])) {
            start++;
            continue;
        }
        size_t end = start;
        while (end < line.size() && is_word_byte(line[end])) {
            end++;
        }
        if (start <= column && column <= end) {
            return std::string(line.substr(start, end - start));
        }
        if (start > column) {
            break;
        }
        start = end;
    }
    return std::nullopt;
}

auto Script::word_at(Cursor cursor) const -> std::optional<std::string> {
    auto offset = offset_of(cursor);
    if (!offset) {
        return std::nullopt;
    }
    return word_at(*offset);
}

auto Script::scope_at(Cursor cursor) const -> ScopeMatch {
    auto line = source_.line(cursor.line + 1);
    if (!source_.line_start(cursor.line + 1) || cursor.column > line.size()) {
        return ScopeMatch{};
    }
    return classify_scope(line.substr(0, cursor.column));
}

auto Script::complete(Cursor cursor, const NameRegistry& registry) const -> std::vector<Name> {
    auto scope = scope_at(cursor);
    CMSCRIPT_LOG_DEBUG("query", "scope " << scope_kind_to_string(scope.kind) << " prefix '"
                                         << scope.prefix << "'");

    std::vector<Name> result;
    for (auto kind : candidate_kinds(scope.kind)) {
        auto names = registry.names(kind);
        result.insert(result.end(), std::make_move_iterator(names.begin()),
                      std::make_move_iterator(names.end()));
    }
    return result;
}

auto Script::hover(Cursor cursor, const NameRegistry& registry) const -> std::optional<Name> {
    auto word = word_at(cursor);
    if (!word) {
        return std::nullopt;
    }
    return registry.find(*word);
}

auto Script::context_at(size_t offset) const
    -> Result<std::optional<CommandContext>, parser::ParseError> {
    auto parsed = parser::parse(source_.content());
    if (is_err(parsed)) {
        return std::move(unwrap_err(parsed));
    }

    auto context = parser::command_at(unwrap(parsed), offset);
    if (!context) {
        return std::optional<CommandContext>{};
    }

    CommandContext result{.command = std::string(context->command->name()),
                          .argument_index = context->argument_index,
                          .argument = std::nullopt};
    if (context->argument_index >= 0) {
        auto arguments = context->command->arguments.arguments();
        std::string text;
        arguments[static_cast<size_t>(context->argument_index)]->append_text(text);
        result.argument = std::move(text);
    }
    return std::optional<CommandContext>{std::move(result)};
}

} // namespace cmscript::query
