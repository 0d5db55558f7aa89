//! # Project Configuration
//!
//! Reads the optional `cmscript.toml` from the working directory.
//!
//! ## Format
//!
//! ```toml
//! [format]
//! max-blank-lines = 3
//! max-argument-blank-lines = 1
//!
//! [fmt]
//! cache = true
//! jobs = 0
//!
//! [query]
//! cmake = "cmake"
//! ```
//!
//! Only this subset of TOML is understood: sections, `key = value` pairs
//! with string, integer and boolean values, and `#` comments. Unknown
//! sections and keys are skipped.

#pragma once

#include "common.hpp"
#include "format/formatter.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace cmscript::cli {

/// Name of the configuration file.
constexpr const char* CONFIG_FILE_NAME = "cmscript.toml";

struct Config {
    format::FormatOptions format;

    bool cache = true;          // Use .cmscript-cache in fmt
    unsigned jobs = 0;          // Format workers, 0 = hardware concurrency
    std::string cmake = "cmake"; // Executable queried for documentation

    /// Loads `path`. A missing file yields the defaults; a malformed one
    /// yields a "Line N: ..." message.
    static Result<Config, std::string> load(const std::filesystem::path& path);

    static Result<Config, std::string> load_from_current_dir();
};

class ConfigParser {
public:
    explicit ConfigParser(const std::string& content);

    std::optional<Config> parse();

    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_comment();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int> parse_number();
    std::optional<bool> parse_boolean();
    bool skip_value();

    bool parse_format_section(format::FormatOptions& options);
    bool parse_fmt_section(Config& config);
    bool parse_query_section(Config& config);
    bool parse_unknown_section();

    /// Reads `key =` and leaves the cursor on the value. Returns false at
    /// the next section header or end of input.
    std::optional<std::string> next_key();

    void set_error(const std::string& message);
};

} // namespace cmscript::cli
