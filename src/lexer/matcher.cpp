//! # Lexeme Matcher Implementation
//!
//! Anchoring comes from `std::regex_constants::match_continuous`, which
//! makes `regex_search` behave as "match a prefix of [first, last)".
//! `match_prev_avail` tells the engine that the byte before `first` is real
//! input, so assertions at the cursor see the true context.

#include "lexer/matcher.hpp"

namespace cmscript::lexer {

auto Matcher::advance(size_t length) -> Match {
    Match match{.pos = offset_, .text = std::string(source_.substr(offset_, length))};
    offset_ += length;
    return match;
}

auto Matcher::eat(const std::regex& pattern) -> std::optional<Match> {
    const char* first = source_.data() + offset_;
    const char* last = source_.data() + source_.size();

    auto flags = std::regex_constants::match_continuous;
    if (offset_ > 0) {
        flags |= std::regex_constants::match_prev_avail;
    }

    std::cmatch m;
    if (!std::regex_search(first, last, m, pattern, flags)) {
        return std::nullopt;
    }
    return advance(static_cast<size_t>(m.length(0)));
}

auto Matcher::eat_literal(std::string_view literal) -> std::optional<Match> {
    if (!remaining().starts_with(literal)) {
        return std::nullopt;
    }
    return advance(literal.size());
}

auto Matcher::eat_until(std::string_view terminator) -> std::optional<Match> {
    auto found = remaining().find(terminator);
    if (found == std::string_view::npos) {
        return std::nullopt;
    }
    return advance(found);
}

} // namespace cmscript::lexer
