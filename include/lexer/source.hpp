//! # Script Source and Row/Column Locator
//!
//! This module owns the text of one CMake script and converts byte offsets
//! into human-facing positions.
//!
//! ## Position Model
//!
//! Offsets (0-based byte indices) are the only positions stored anywhere in
//! the syntax tree. A `TextPos` is derived on demand:
//!
//! - `row` is 1 + the number of `\n` bytes before the offset
//! - `col` is 1 + the number of bytes between the start of that line and
//!   the offset
//!
//! ## Example
//!
//! ```cpp
//! auto pos = rowcol("a\nbc\n", 3); // {row = 2, col = 2}
//!
//! Source source = Source::from_string("project(demo)\n", "CMakeLists.txt");
//! std::string_view first = source.line(1); // "project(demo)"
//! ```

#ifndef CMSCRIPT_LEXER_SOURCE_HPP
#define CMSCRIPT_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cmscript::lexer {

/// Converts an offset into a 1-based row/column by scanning `text[:offset]`.
///
/// Pure and O(offset). Offsets past the end are clamped to the end.
[[nodiscard]] auto rowcol(std::string_view text, size_t offset) -> TextPos;

/// A script's text plus an index of line starts.
///
/// String views returned by `content()`, `slice()` and `line()` are valid as
/// long as the Source exists.
class Source {
public:
    /// Constructs a source from a name and content and builds the line index.
    Source(std::string name, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    /// Returns the file name or identifier used in diagnostics.
    [[nodiscard]] auto name() const -> std::string_view {
        return name_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns `content[start:end]`, clamped to valid bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Same result as `rowcol(content(), offset)` in O(log n).
    [[nodiscard]] auto position(size_t offset) const -> TextPos;

    /// Returns the offset of the first byte of line `row` (1-based).
    ///
    /// Returns `std::nullopt` if the row does not exist.
    [[nodiscard]] auto line_start(uint32_t row) const -> std::optional<size_t>;

    /// Returns the content of line `row` (1-based) without its terminator.
    ///
    /// Returns an empty view if the row is out of range.
    [[nodiscard]] auto line(uint32_t row) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Inverse of `position()`: the offset of 1-based `row` and `col`.
    ///
    /// `col` may point one past the last byte of the line. Returns
    /// `std::nullopt` if the row does not exist or the column is past that.
    [[nodiscard]] auto offset_of(uint32_t row, uint32_t col) const -> std::optional<size_t>;

    /// Loads a script from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string name_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Offset of each line start.

    void build_line_index();
};

} // namespace cmscript::lexer

#endif // CMSCRIPT_LEXER_SOURCE_HPP
