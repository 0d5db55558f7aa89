//! # Command Formatting
//!
//! Commands and argument lists. Grouped lists recurse through
//! `layout_arguments()`, so the same spacing rules hold at every depth.

#include "format/formatter.hpp"

#include <type_traits>

namespace cmscript::format {

using parser::TokenKind;

auto Formatter::format_command(const parser::CommandInvocation& command) -> std::string {
    return layout_command(command).text;
}

auto Formatter::format_arguments(const parser::Arguments& arguments) -> std::string {
    return layout_arguments(arguments).text;
}

auto Formatter::layout_command(const parser::CommandInvocation& command) -> Layout {
    Layout out;
    out.append(command.identifier.text);
    if (command.space) {
        out.append(" ");
    }
    out.append(layout_arguments(command.arguments));
    return out;
}

auto Formatter::layout_arguments(const parser::Arguments& arguments) -> Layout {
    Layout out;

    const auto& children = arguments.children;
    for (size_t i = 0; i < children.size(); ++i) {
        const auto* prev = i > 0 ? &children[i - 1] : nullptr;
        const auto* next = i + 1 < children.size() ? &children[i + 1] : nullptr;

        std::visit(
            [&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, parser::Token>) {
                    if (!node.is(TokenKind::Space)) {
                        out.append(node.text);
                        return;
                    }
                    // Indentation after a line break is kept as written.
                    if (prev != nullptr && prev->is_token(TokenKind::Newline)) {
                        out.append(node.text);
                        return;
                    }
                    if (prev == nullptr || prev->is_token(TokenKind::LParen) ||
                        prev->is_token(TokenKind::Space)) {
                        return;
                    }
                    if (next == nullptr || next->is_token(TokenKind::RParen)) {
                        return;
                    }
                    out.append(" ");
                } else if constexpr (std::is_same_v<T, parser::Leaf>) {
                    out.append_leaf(node);
                } else if constexpr (std::is_same_v<T, parser::ArgumentsPtr>) {
                    out.append(layout_arguments(*node));
                } else {
                    static_assert(always_false_v<T>, "unhandled argument element");
                }
            },
            children[i].kind);
    }

    return normalize(out, options_.max_argument_blank_lines, false);
}

} // namespace cmscript::format
