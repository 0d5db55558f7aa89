//! # Formatter Core
//!
//! File-level pass and newline normalization.
//!
//! ## Functions
//!
//! | Method                 | Description                                 |
//! |------------------------|---------------------------------------------|
//! | `format()`             | Format a complete file                      |
//! | `format_file_token()`  | Newline/space/EOF handling at file scope    |
//! | `normalize_newlines()` | Trailing whitespace and blank-line clamping |
//! | `normalize()`          | The same over a layout with verbatim ranges |
//! | `format_source()`      | Parse and format in one call                |

#include "format/formatter.hpp"
#include "log/log.hpp"

#include <type_traits>
#include <vector>

namespace cmscript::format {

auto FormatOptions::fingerprint() const -> std::string {
    return "cmscript-format/2;blank=" + std::to_string(max_blank_lines) +
           ";arg-blank=" + std::to_string(max_argument_blank_lines);
}

Formatter::Formatter(FormatOptions options) : options_(std::move(options)) {}

// ============================================================================
// Layout
// ============================================================================

void Formatter::Layout::append(std::string_view piece) {
    text += piece;
}

void Formatter::Layout::append(const Layout& other) {
    auto shift = text.size();
    for (const auto& [begin, end] : other.verbatim) {
        verbatim.emplace_back(begin + shift, end + shift);
    }
    text += other.text;
}

void Formatter::Layout::append_verbatim(std::string_view piece) {
    verbatim.emplace_back(text.size(), text.size() + piece.size());
    text += piece;
}

void Formatter::Layout::append_leaf(const parser::Leaf& leaf) {
    switch (leaf.kind) {
    case parser::LeafKind::QuotedArgument:
    case parser::LeafKind::BracketArgument:
    case parser::LeafKind::BracketComment:
        append_verbatim(leaf.text());
        break;
    case parser::LeafKind::UnquotedArgument:
    case parser::LeafKind::LineComment:
        append(leaf.text());
        break;
    }
}

// ============================================================================
// File
// ============================================================================

void Formatter::emit(std::string_view text) {
    output_.append(text);
}

auto Formatter::format(const parser::File& file) -> std::string {
    output_ = Layout{};

    const auto& children = file.children;
    for (size_t i = 0; i < children.size(); ++i) {
        const auto* next = i + 1 < children.size() ? &children[i + 1] : nullptr;

        std::visit(
            [this, next](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, parser::Token>) {
                    format_file_token(node, next);
                } else if constexpr (std::is_same_v<T, parser::Leaf>) {
                    output_.append_leaf(node);
                } else if constexpr (std::is_same_v<T, parser::CommandInvocation>) {
                    output_.append(layout_command(node));
                } else {
                    static_assert(always_false_v<T>, "unhandled file element");
                }
            },
            children[i].kind);
    }

    auto result = normalize(output_, options_.max_blank_lines, true).text;
    CMSCRIPT_LOG_TRACE("format", "formatted " << children.size() << " file elements into "
                                              << result.size() << " bytes");
    return result;
}

void Formatter::format_file_token(const parser::Token& token, const parser::FileElement* next) {
    switch (token.kind) {
    case parser::TokenKind::Eof:
        break;
    case parser::TokenKind::Space:
        // Trailing blanks before a newline or the end of input.
        if (next == nullptr || next->is_token(parser::TokenKind::Newline) ||
            next->is_token(parser::TokenKind::Eof)) {
            break;
        }
        emit(token.text);
        break;
    case parser::TokenKind::Newline:
    case parser::TokenKind::Identifier:
    case parser::TokenKind::Text:
    case parser::TokenKind::LParen:
    case parser::TokenKind::RParen:
    case parser::TokenKind::LBracket:
    case parser::TokenKind::RBracket:
    case parser::TokenKind::Quote:
    case parser::TokenKind::CommentMark:
        emit(token.text);
        break;
    }
}

// ============================================================================
// Newlines
// ============================================================================

auto Formatter::normalize_newlines(std::string_view text, int max_blank_lines, bool normalize_eof)
    -> std::string {
    Layout layout;
    layout.append(text);
    return normalize(layout, max_blank_lines, normalize_eof).text;
}

auto Formatter::normalize(const Layout& layout, int max_blank_lines, bool normalize_eof)
    -> Layout {
    // A line is `[begin, end)`; verbatim ranges `[first_range, last_range)`
    // lie inside it, and only `[open, end)` after the last of them may be
    // stripped.
    struct Line {
        size_t begin;
        size_t end;
        size_t open;
        size_t first_range;
        size_t last_range;
    };

    std::string_view text = layout.text;
    const auto& ranges = layout.verbatim;

    std::vector<Line> lines;
    Line line{.begin = 0, .end = 0, .open = 0, .first_range = 0, .last_range = 0};
    size_t range = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (range < ranges.size() && ranges[range].first == pos) {
            pos = ranges[range].second;
            line.open = pos;
            line.last_range = ++range;
            continue;
        }
        if (text[pos] == '\n') {
            line.end = pos;
            lines.push_back(line);
            line = Line{.begin = pos + 1,
                        .end = pos + 1,
                        .open = pos + 1,
                        .first_range = range,
                        .last_range = range};
        }
        pos++;
    }
    if (line.begin < text.size()) {
        line.end = text.size();
        lines.push_back(line);
    }

    std::vector<Line> kept;
    kept.reserve(lines.size());
    int blank_run = 0;
    for (auto current : lines) {
        auto tail = text.substr(current.open, current.end - current.open);
        auto last = tail.find_last_not_of(" \t\r\f\v");
        current.end = last == std::string_view::npos ? current.open : current.open + last + 1;

        if (current.end == current.begin) {
            if (++blank_run > max_blank_lines) {
                continue;
            }
        } else {
            blank_run = 0;
        }
        kept.push_back(current);
    }

    if (normalize_eof) {
        while (!kept.empty() && kept.back().end == kept.back().begin) {
            kept.pop_back();
        }
    }

    Layout result;
    result.text.reserve(text.size() + 1);
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            result.text += '\n';
        }
        auto shift = result.text.size();
        for (size_t r = kept[i].first_range; r < kept[i].last_range; ++r) {
            result.verbatim.emplace_back(ranges[r].first - kept[i].begin + shift,
                                         ranges[r].second - kept[i].begin + shift);
        }
        result.text += text.substr(kept[i].begin, kept[i].end - kept[i].begin);
    }
    if (normalize_eof && !kept.empty()) {
        result.text += '\n';
    }
    return result;
}

auto format_source(std::string_view source, const FormatOptions& options)
    -> Result<std::string, parser::ParseError> {
    auto parsed = parser::parse(source);
    if (is_err(parsed)) {
        return std::move(unwrap_err(parsed));
    }
    Formatter formatter(options);
    return formatter.format(unwrap(parsed));
}

} // namespace cmscript::format
