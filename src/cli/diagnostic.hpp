//! # Diagnostics
//!
//! User-facing error reports. A syntax error is shown with the offending
//! source line and a caret under the failure column:
//!
//! ```text
//! error[P003]: expected ')' to close '(' opened at 1:4, found end of input
//!   --> CMakeLists.txt:1:5
//!   |
//! 1 | foo(
//!   |     ^
//! ```
//!
//! Errors without a location (missing files, bad cursors) print the header
//! line only.
//!
//! | Code | Meaning                  |
//! |------|--------------------------|
//! | P0xx | Syntax error, see parser |
//! | E001 | File cannot be read      |
//! | E002 | File cannot be written   |
//! | E003 | Cursor outside the file  |

#pragma once

#include "common.hpp"
#include "parser/parser.hpp"

#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cmscript::cli {

namespace ErrorCodes {
constexpr const char* FILE_NOT_FOUND = "E001";
constexpr const char* IO_ERROR = "E002";
constexpr const char* INVALID_CURSOR = "E003";
} // namespace ErrorCodes

enum class Severity {
    Error,
    Warning,
};

/// Where a diagnostic points.
struct SourceLocation {
    std::string path;
    TextPos pos;
    std::string line_text; ///< The source line at `pos.row`, without its terminator
};

struct Diagnostic {
    Severity severity = Severity::Error;
    std::string code;
    std::string message;
    std::optional<SourceLocation> location;
};

/// Builds the location of `pos` in `content`, copying the line it is on.
[[nodiscard]] SourceLocation locate(const std::string& path, std::string_view content,
                                    TextPos pos);

/// Renders a diagnostic as the lines shown above, with a trailing blank line.
[[nodiscard]] std::string render_diagnostic(const Diagnostic& diagnostic, bool color);

/// Writes diagnostics to a stream. Safe to share between format workers;
/// each diagnostic is written in one piece.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr) : out_(out) {}

    void set_color_enabled(bool enabled) {
        color_ = enabled;
    }

    void emit(const Diagnostic& diagnostic);

    /// Reports a parse failure of `content`, read from `path`.
    void syntax_error(const std::string& path, std::string_view content,
                      const parser::ParseError& error);

    /// Reports an error that has no source location.
    void error(const std::string& code, const std::string& message);

    size_t error_count() const;

private:
    std::ostream& out_;
    bool color_ = false;
    mutable std::mutex mutex_;
    size_t errors_ = 0;
};

/// The emitter the commands report through, writing to stderr.
DiagnosticEmitter& get_diagnostic_emitter();

/// True when stderr is a terminal that understands ANSI colors.
bool terminal_supports_colors();

} // namespace cmscript::cli
