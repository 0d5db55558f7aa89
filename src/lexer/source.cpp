//! # Source Buffer Implementation

#include "lexer/source.hpp"

#include <algorithm>
#include <fstream>

namespace cmscript::lexer {

auto rowcol(std::string_view text, size_t offset) -> TextPos {
    auto prefix = text.substr(0, std::min(offset, text.size()));

    auto last_newline = prefix.rfind('\n');
    auto newlines = static_cast<uint32_t>(std::count(prefix.begin(), prefix.end(), '\n'));
    size_t line_start = last_newline == std::string_view::npos ? 0 : last_newline + 1;

    return TextPos{.row = newlines + 1, .col = static_cast<uint32_t>(prefix.size() - line_start) + 1};
}

Source::Source(std::string name, std::string content)
    : name_(std::move(name)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.assign(1, 0);
    for (auto nl = content_.find('\n'); nl != std::string::npos; nl = content_.find('\n', nl + 1)) {
        line_offsets_.push_back(nl + 1);
    }
}

auto Source::at(size_t offset) const -> char {
    if (offset >= content_.size()) {
        return '\0';
    }
    return content_[offset];
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    if (start >= content_.size() || end <= start) {
        return {};
    }
    end = std::min(end, content_.size());
    return std::string_view(content_).substr(start, end - start);
}

auto Source::position(size_t offset) const -> TextPos {
    offset = std::min(offset, content_.size());

    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    --it; // line_offsets_[0] == 0 <= offset

    auto row = static_cast<uint32_t>(std::distance(line_offsets_.begin(), it)) + 1;
    auto col = static_cast<uint32_t>(offset - *it) + 1;
    return TextPos{.row = row, .col = col};
}

auto Source::line_start(uint32_t row) const -> std::optional<size_t> {
    if (row == 0 || row > line_offsets_.size()) {
        return std::nullopt;
    }
    return line_offsets_[row - 1];
}

auto Source::line(uint32_t row) const -> std::string_view {
    auto start = line_start(row);
    if (!start) {
        return {};
    }

    size_t end = row < line_offsets_.size() ? line_offsets_[row] : content_.size();
    if (end > *start && content_[end - 1] == '\n') {
        --end;
    }
    if (end > *start && content_[end - 1] == '\r') {
        --end;
    }
    return std::string_view(content_).substr(*start, end - *start);
}

auto Source::line_count() const -> uint32_t {
    return static_cast<uint32_t>(line_offsets_.size());
}

auto Source::offset_of(uint32_t row, uint32_t col) const -> std::optional<size_t> {
    auto start = line_start(row);
    if (!start || col == 0 || col - 1 > line(row).size()) {
        return std::nullopt;
    }
    return *start + (col - 1);
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        return "Cannot read file: " + path;
    }

    auto size = in.tellg();
    if (size < 0) {
        return "Cannot read file: " + path + " (not a regular file)";
    }

    std::string text(static_cast<size_t>(size), '\0');
    in.seekg(0);
    if (!in.read(text.data(), static_cast<std::streamsize>(text.size()))) {
        return "Cannot read file: " + path + " (read failed)";
    }
    return Source(path, std::move(text));
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace cmscript::lexer
