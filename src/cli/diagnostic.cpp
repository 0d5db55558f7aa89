//! # Diagnostics Implementation

#include "diagnostic.hpp"

#include <cstdlib>
#include <sstream>

#include <unistd.h>

namespace cmscript::cli {

namespace {

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD_RED = "\033[1;91m";
constexpr const char* BOLD_YELLOW = "\033[1;93m";
constexpr const char* BLUE = "\033[94m";
constexpr const char* BOLD = "\033[1m";

/// The `row`-th line of `content` (1-based), or empty past the end.
std::string_view nth_line(std::string_view content, uint32_t row) {
    size_t start = 0;
    for (uint32_t current = 1; current < row; ++current) {
        auto newline = content.find('\n', start);
        if (newline == std::string_view::npos) {
            return {};
        }
        start = newline + 1;
    }

    auto line = content.substr(start, content.find('\n', start) - start);
    if (line.ends_with('\r')) {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

SourceLocation locate(const std::string& path, std::string_view content, TextPos pos) {
    return SourceLocation{
        .path = path, .pos = pos, .line_text = std::string(nth_line(content, pos.row))};
}

std::string render_diagnostic(const Diagnostic& diagnostic, bool color) {
    auto paint = [color](const char* code) { return color ? code : ""; };
    std::ostringstream out;

    bool is_error = diagnostic.severity == Severity::Error;
    out << paint(is_error ? BOLD_RED : BOLD_YELLOW) << (is_error ? "error" : "warning");
    if (!diagnostic.code.empty()) {
        out << '[' << diagnostic.code << ']';
    }
    out << paint(RESET) << paint(BOLD) << ": " << diagnostic.message << paint(RESET) << '\n';

    if (diagnostic.location) {
        const auto& where = *diagnostic.location;
        std::string row = std::to_string(where.pos.row);
        std::string gutter(row.size() + 1, ' ');

        out << gutter << paint(BLUE) << "--> " << paint(RESET) << where.path << ':'
            << where.pos.row << ':' << where.pos.col << '\n';
        out << gutter << paint(BLUE) << '|' << paint(RESET) << '\n';
        out << paint(BLUE) << row << " | " << paint(RESET) << where.line_text << '\n';

        // Tabs are kept so the caret lines up under tab-indented text.
        std::string pad;
        for (size_t i = 0; i + 1 < where.pos.col; ++i) {
            pad += i < where.line_text.size() && where.line_text[i] == '\t' ? '\t' : ' ';
        }
        out << gutter << paint(BLUE) << "| " << paint(RESET) << pad
            << paint(is_error ? BOLD_RED : BOLD_YELLOW) << '^' << paint(RESET) << '\n';
    }

    out << '\n';
    return out.str();
}

// ============================================================================
// DiagnosticEmitter
// ============================================================================

void DiagnosticEmitter::emit(const Diagnostic& diagnostic) {
    auto text = render_diagnostic(diagnostic, color_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (diagnostic.severity == Severity::Error) {
        errors_++;
    }
    out_ << text;
    out_.flush();
}

void DiagnosticEmitter::syntax_error(const std::string& path, std::string_view content,
                                     const parser::ParseError& error) {
    emit(Diagnostic{.severity = Severity::Error,
                    .code = error.code,
                    .message = error.message,
                    .location = locate(path, content, error.pos)});
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message) {
    emit(Diagnostic{.severity = Severity::Error,
                    .code = code,
                    .message = message,
                    .location = std::nullopt});
}

size_t DiagnosticEmitter::error_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

} // namespace cmscript::cli
