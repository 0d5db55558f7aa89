//! # Syntax Tree Implementation
//!
//! Text reconstruction, span queries, cursor lookup and the debug outline.
//! All traversals are single downward walks dispatched with `std::visit`.

#include "parser/ast.hpp"

#include <sstream>
#include <type_traits>

namespace cmscript::parser {

auto leaf_kind_to_string(LeafKind kind) -> std::string_view {
    switch (kind) {
    case LeafKind::BracketArgument:
        return "BracketArgument";
    case LeafKind::QuotedArgument:
        return "QuotedArgument";
    case LeafKind::UnquotedArgument:
        return "UnquotedArgument";
    case LeafKind::BracketComment:
        return "BracketComment";
    case LeafKind::LineComment:
        return "LineComment";
    }
    return "unknown";
}

// ============================================================================
// Leaf
// ============================================================================

auto Leaf::text() const -> std::string {
    std::string out;
    for (const auto& token : tokens) {
        out += token.text;
    }
    return out;
}

auto Leaf::content() const -> std::string_view {
    if (kind == LeafKind::UnquotedArgument) {
        return tokens.front().text;
    }
    for (const auto& token : tokens) {
        if (token.is(TokenKind::Text)) {
            return token.text;
        }
    }
    return {};
}

// ============================================================================
// ArgElement / Arguments
// ============================================================================

auto ArgElement::is_token(TokenKind k) const -> bool {
    return is<Token>() && std::get<Token>(kind).is(k);
}

auto ArgElement::is_argument() const -> bool {
    if (is<ArgumentsPtr>()) {
        return true;
    }
    return is<Leaf>() && std::get<Leaf>(kind).is_argument();
}

auto ArgElement::start() const -> size_t {
    return std::visit(
        [](const auto& node) -> size_t {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Token>) {
                return node.pos;
            } else if constexpr (std::is_same_v<T, Leaf>) {
                return node.start();
            } else if constexpr (std::is_same_v<T, ArgumentsPtr>) {
                return node->start().value_or(0);
            } else {
                static_assert(always_false_v<T>, "unhandled argument element");
            }
        },
        kind);
}

auto ArgElement::end() const -> size_t {
    return std::visit(
        [](const auto& node) -> size_t {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Token>) {
                return node.end();
            } else if constexpr (std::is_same_v<T, Leaf>) {
                return node.end();
            } else if constexpr (std::is_same_v<T, ArgumentsPtr>) {
                return node->end().value_or(0);
            } else {
                static_assert(always_false_v<T>, "unhandled argument element");
            }
        },
        kind);
}

void ArgElement::append_text(std::string& out) const {
    std::visit(
        [&out](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Token>) {
                out += node.text;
            } else if constexpr (std::is_same_v<T, Leaf>) {
                for (const auto& token : node.tokens) {
                    out += token.text;
                }
            } else if constexpr (std::is_same_v<T, ArgumentsPtr>) {
                node->append_text(out);
            } else {
                static_assert(always_false_v<T>, "unhandled argument element");
            }
        },
        kind);
}

auto Arguments::start() const -> std::optional<size_t> {
    if (children.empty()) {
        return std::nullopt;
    }
    return children.front().start();
}

auto Arguments::end() const -> std::optional<size_t> {
    if (children.empty()) {
        return std::nullopt;
    }
    return children.back().end();
}

auto Arguments::text() const -> std::string {
    std::string out;
    append_text(out);
    return out;
}

void Arguments::append_text(std::string& out) const {
    for (const auto& child : children) {
        child.append_text(out);
    }
}

auto Arguments::arguments() const -> std::vector<const ArgElement*> {
    std::vector<const ArgElement*> result;
    for (const auto& child : children) {
        if (child.is_argument()) {
            result.push_back(&child);
        }
    }
    return result;
}

// ============================================================================
// CommandInvocation / File
// ============================================================================

auto CommandInvocation::end() const -> size_t {
    if (auto args_end = arguments.end()) {
        return *args_end;
    }
    return space ? space->end() : identifier.end();
}

auto CommandInvocation::text() const -> std::string {
    std::string out;
    append_text(out);
    return out;
}

void CommandInvocation::append_text(std::string& out) const {
    out += identifier.text;
    if (space) {
        out += space->text;
    }
    arguments.append_text(out);
}

auto FileElement::is_token(TokenKind k) const -> bool {
    return is<Token>() && std::get<Token>(kind).is(k);
}

auto FileElement::start() const -> size_t {
    return std::visit(
        [](const auto& node) -> size_t {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Token>) {
                return node.pos;
            } else {
                return node.start();
            }
        },
        kind);
}

auto FileElement::end() const -> size_t {
    return std::visit([](const auto& node) -> size_t { return node.end(); }, kind);
}

void FileElement::append_text(std::string& out) const {
    std::visit(
        [&out](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Token>) {
                out += node.text;
            } else if constexpr (std::is_same_v<T, Leaf>) {
                out += node.text();
            } else if constexpr (std::is_same_v<T, CommandInvocation>) {
                node.append_text(out);
            } else {
                static_assert(always_false_v<T>, "unhandled file element");
            }
        },
        kind);
}

auto File::start() const -> std::optional<size_t> {
    if (children.empty()) {
        return std::nullopt;
    }
    return children.front().start();
}

auto File::end() const -> std::optional<size_t> {
    if (children.empty()) {
        return std::nullopt;
    }
    return children.back().end();
}

auto File::text() const -> std::string {
    std::string out;
    for (const auto& child : children) {
        child.append_text(out);
    }
    return out;
}

auto File::commands() const -> std::vector<const CommandInvocation*> {
    std::vector<const CommandInvocation*> result;
    for (const auto& child : children) {
        if (child.is<CommandInvocation>()) {
            result.push_back(&std::get<CommandInvocation>(child.kind));
        }
    }
    return result;
}

// ============================================================================
// Tree Queries
// ============================================================================

auto command_at(const File& file, size_t offset) -> std::optional<CursorContext> {
    for (const auto* command : file.commands()) {
        if (offset < command->start() || offset > command->end()) {
            continue;
        }

        int index = 0;
        for (const auto* argument : command->arguments.arguments()) {
            if (offset >= argument->start() && offset <= argument->end()) {
                return CursorContext{.command = command, .argument_index = index};
            }
            ++index;
        }
        return CursorContext{.command = command, .argument_index = -1};
    }
    return std::nullopt;
}

namespace {

void collect_tokens(const Arguments& args, std::vector<Token>& out);

void collect_tokens(const ArgElement& element, std::vector<Token>& out) {
    std::visit(
        [&out](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Token>) {
                out.push_back(node);
            } else if constexpr (std::is_same_v<T, Leaf>) {
                out.insert(out.end(), node.tokens.begin(), node.tokens.end());
            } else if constexpr (std::is_same_v<T, ArgumentsPtr>) {
                collect_tokens(*node, out);
            } else {
                static_assert(always_false_v<T>, "unhandled argument element");
            }
        },
        element.kind);
}

void collect_tokens(const Arguments& args, std::vector<Token>& out) {
    for (const auto& child : args.children) {
        collect_tokens(child, out);
    }
}

} // namespace

auto tokens(const File& file) -> std::vector<Token> {
    std::vector<Token> out;
    for (const auto& child : file.children) {
        std::visit(
            [&out](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, Token>) {
                    out.push_back(node);
                } else if constexpr (std::is_same_v<T, Leaf>) {
                    out.insert(out.end(), node.tokens.begin(), node.tokens.end());
                } else if constexpr (std::is_same_v<T, CommandInvocation>) {
                    out.push_back(node.identifier);
                    if (node.space) {
                        out.push_back(*node.space);
                    }
                    collect_tokens(node.arguments, out);
                } else {
                    static_assert(always_false_v<T>, "unhandled file element");
                }
            },
            child.kind);
    }
    return out;
}

namespace {

/// Quotes text for the outline, escaping control characters.
auto quoted(std::string_view text) -> std::string {
    std::string out = "\"";
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
        default:
            out += c;
        }
    }
    out += '"';
    return out;
}

class TreeDumper {
public:
    auto dump(const File& file) -> std::string {
        line() << "File" << range(file.start(), file.end());
        ++depth_;
        for (const auto& child : file.children) {
            std::visit([this](const auto& node) { visit(node); }, child.kind);
        }
        --depth_;
        return out_.str();
    }

private:
    std::ostringstream out_;
    int depth_ = 0;

    auto line() -> std::ostringstream& {
        if (out_.tellp() > 0) {
            out_ << '\n';
        }
        out_ << std::string(static_cast<size_t>(depth_) * 2, ' ');
        return out_;
    }

    static auto range(std::optional<size_t> start, std::optional<size_t> end) -> std::string {
        if (!start || !end) {
            return " [empty]";
        }
        return " [" + std::to_string(*start) + ", " + std::to_string(*end) + ")";
    }

    void visit(const Token& token) {
        line() << lexer::token_kind_to_string(token.kind) << " " << token.pos << " "
               << quoted(token.text);
    }

    void visit(const Leaf& leaf) {
        line() << leaf_kind_to_string(leaf.kind) << range(leaf.start(), leaf.end()) << " "
               << quoted(leaf.text());
    }

    void visit(const ArgumentsPtr& group) {
        visit(*group);
    }

    void visit(const Arguments& args) {
        line() << (args.grouped ? "GroupedArguments" : "Arguments")
               << range(args.start(), args.end());
        ++depth_;
        for (const auto& child : args.children) {
            std::visit([this](const auto& node) { visit(node); }, child.kind);
        }
        --depth_;
    }

    void visit(const CommandInvocation& command) {
        line() << "CommandInvocation" << range(command.start(), command.end()) << " "
               << quoted(command.name());
        ++depth_;
        visit(command.identifier);
        if (command.space) {
            visit(*command.space);
        }
        visit(command.arguments);
        --depth_;
    }
};

} // namespace

auto dump(const File& file) -> std::string {
    return TreeDumper{}.dump(file);
}

} // namespace cmscript::parser
