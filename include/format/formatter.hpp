//! # Script Formatter
//!
//! Re-emits a parsed `File` with normalized whitespace. The formatter only
//! reads the tree and returns a new string; it never changes arguments,
//! comments or command names.
//!
//! Quoted arguments, bracket arguments and bracket comments are copied byte
//! for byte. Newlines inside them do not start a line for the rules below,
//! so their blank lines and trailing blanks are part of the value.
//!
//! ## Rules
//!
//! | Scope          | Rule                                                  |
//! |----------------|-------------------------------------------------------|
//! | file           | blanks before a newline or end of input are dropped   |
//! | command        | blanks between the name and `(` become one space      |
//! | argument list  | blanks after `(` and before `)` are dropped           |
//! | argument list  | blanks after a newline (indentation) are kept         |
//! | argument list  | other blank runs become one space                     |
//! | every line     | trailing whitespace is stripped                       |
//! | argument list  | at most `max_argument_blank_lines` blank lines in a row |
//! | file           | at most `max_blank_lines` blank lines in a row        |
//! | file           | output ends with exactly one newline                  |
//!
//! Formatting is idempotent: formatting already formatted text returns it
//! unchanged.

#ifndef CMSCRIPT_FORMAT_FORMATTER_HPP
#define CMSCRIPT_FORMAT_FORMATTER_HPP

#include "common.hpp"
#include "parser/ast.hpp"
#include "parser/parser.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmscript::format {

/// Formatter options.
struct FormatOptions {
    int max_blank_lines = 3;          ///< Consecutive blank lines kept at file scope
    int max_argument_blank_lines = 1; ///< Consecutive blank lines kept inside `(...)`

    /// Stable text identifying these options, part of the format cache key.
    [[nodiscard]] auto fingerprint() const -> std::string;

    [[nodiscard]] auto operator==(const FormatOptions& other) const -> bool = default;
};

/// CMake script formatter.
class Formatter {
public:
    explicit Formatter(FormatOptions options = {});

    /// Formats a complete file.
    auto format(const parser::File& file) -> std::string;

    /// Formats one command: name, optional single space, argument list.
    auto format_command(const parser::CommandInvocation& command) -> std::string;

    /// Formats a (possibly grouped) argument list from `(` to `)`.
    auto format_arguments(const parser::Arguments& arguments) -> std::string;

    /// Strips trailing whitespace from every line and keeps at most
    /// `max_blank_lines` consecutive blank lines.
    ///
    /// With `normalize_eof`, trailing blank lines are removed and a
    /// non-empty result ends with exactly one `\n`. Without it, the result
    /// has no trailing line terminator.
    [[nodiscard]] static auto normalize_newlines(std::string_view text, int max_blank_lines,
                                                 bool normalize_eof) -> std::string;

    [[nodiscard]] auto options() const -> const FormatOptions& {
        return options_;
    }

private:
    /// Output text plus the byte ranges of it that are copied verbatim.
    struct Layout {
        std::string text;
        std::vector<std::pair<size_t, size_t>> verbatim; ///< Sorted `[begin, end)`

        void append(std::string_view piece);
        void append(const Layout& other);
        void append_verbatim(std::string_view piece);
        void append_leaf(const parser::Leaf& leaf);
    };

    FormatOptions options_;
    Layout output_;

    void emit(std::string_view text);
    void format_file_token(const parser::Token& token, const parser::FileElement* next);
    auto layout_command(const parser::CommandInvocation& command) -> Layout;
    auto layout_arguments(const parser::Arguments& arguments) -> Layout;

    /// `normalize_newlines()` over a layout; verbatim ranges are neither
    /// split into lines nor stripped.
    [[nodiscard]] static auto normalize(const Layout& layout, int max_blank_lines,
                                        bool normalize_eof) -> Layout;
};

/// Parses and formats `source` in one step.
[[nodiscard]] auto format_source(std::string_view source, const FormatOptions& options = {})
    -> Result<std::string, parser::ParseError>;

} // namespace cmscript::format

#endif // CMSCRIPT_FORMAT_FORMATTER_HPP
