//! # Logging
//!
//! Developer-facing logging, separate from the diagnostics the CLI renders
//! for users. Every message carries a level and a module tag such as
//! `"parse"`, `"fmt"` or `"cache"`.
//!
//! ## Thresholds
//!
//! Each module has a threshold level; messages below it are dropped before
//! the message text is built. Thresholds come from a rule list:
//!
//! ```text
//! parse=trace,cache=off,*=warn
//! ```
//!
//! A bare module name (`query`) means `query=trace`. Modules without a rule
//! use the `*` threshold, which defaults to the level picked by
//! `--log-level`, `-v`/`-vv`/`-vvv` or `-q`.
//!
//! ## Usage
//!
//! ```cpp
//! CMSCRIPT_LOG_INFO("fmt", "Formatted " << path);
//! CMSCRIPT_LOG_TRACE("parse", "command '" << name << "' at " << pos);
//! ```
//!
//! `CMSCRIPT_MIN_LOG_LEVEL` removes calls below a level at compile time
//! (0 = Trace .. 6 = Off).

#ifndef CMSCRIPT_LOG_LOG_HPP
#define CMSCRIPT_LOG_LOG_HPP

#include "common.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmscript::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off,
};

/// Upper-case level name ("TRACE" .. "OFF").
[[nodiscard]] auto level_name(LogLevel level) -> std::string_view;

/// Parses a level name, ignoring case. "warning" is accepted for Warn.
[[nodiscard]] auto parse_level(std::string_view text) -> std::optional<LogLevel>;

enum class LogFormat : uint8_t {
    Text, ///< `12:04:31.207 WARN  [fmt] message`
    Json, ///< One JSON object per line
};

/// One log message.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string module;
    std::string message;
    const char* file = nullptr; ///< `__FILE__` of the call site
    int line = 0;               ///< `__LINE__` of the call site
    std::chrono::system_clock::time_point time;
};

/// Renders a record as one line including the trailing `\n`.
///
/// `color` wraps the level name in ANSI codes; it is ignored for JSON.
[[nodiscard]] auto render(const LogRecord& record, LogFormat format, bool color = false)
    -> std::string;

// ============================================================================
// Sinks
// ============================================================================

/// Destination for log records. Sinks are called under the logger's lock.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() {}
};

/// Writes to a stream the sink does not own, `std::cerr` by default.
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out = std::cerr, LogFormat format = LogFormat::Text,
                        bool color = false);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
    LogFormat format_;
    bool color_;
};

/// Appends to a log file and flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    /// Opens `path`, truncating it unless `append` is set.
    [[nodiscard]] static auto open(const std::string& path, LogFormat format,
                                   bool append = true) -> Result<std::unique_ptr<FileSink>>;

    void write(const LogRecord& record) override;
    void flush() override;

private:
    FileSink(std::ofstream file, LogFormat format);

    std::ofstream file_;
    LogFormat format_;
};

/// Keeps records in memory.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;

    /// A copy of everything written so far.
    [[nodiscard]] auto records() const -> std::vector<LogRecord>;

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// ============================================================================
// Module Filter
// ============================================================================

/// Per-module thresholds.
class LogFilter {
public:
    explicit LogFilter(LogLevel fallback = LogLevel::Warn) : fallback_(fallback) {}

    /// Adds the rules of a comma-separated list. Later rules for a module
    /// replace earlier ones; `*=level` replaces the fallback.
    ///
    /// Returns the number of rules added, or the first malformed rule. Rules
    /// before the malformed one stay applied.
    auto parse(std::string_view rules) -> Result<size_t>;

    /// The threshold for `module`: its rule if there is one, else the fallback.
    [[nodiscard]] auto threshold(std::string_view module) const -> LogLevel;

    [[nodiscard]] auto allows(LogLevel level, std::string_view module) const -> bool {
        return level != LogLevel::Off && level >= threshold(module);
    }

    /// The lowest threshold of any module.
    [[nodiscard]] auto lowest() const -> LogLevel;

    [[nodiscard]] auto fallback() const -> LogLevel {
        return fallback_;
    }

    void set_fallback(LogLevel level) {
        fallback_ = level;
    }

private:
    LogLevel fallback_;
    std::vector<std::pair<std::string, LogLevel>> rules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter;       ///< Module rule list, see LogFilter
    std::string file;         ///< Log file path, empty for none
    bool console = true;      ///< Log to stderr
    bool color = true;        ///< ANSI colors on stderr, when it is a terminal
    std::vector<std::string> problems; ///< Options that could not be applied
};

/// The process-wide logger.
///
/// Before `init()` runs it logs Warn and above to stderr, so library code
/// can log from the first line of `main`.
class Logger {
public:
    [[nodiscard]] static auto instance() -> Logger&;

    /// Replaces the sinks and thresholds of the process logger.
    ///
    /// Returns `config.problems` followed by any problem found while applying
    /// the configuration (a malformed filter rule, an unopenable log file).
    static auto init(const LogConfig& config) -> std::vector<std::string>;

    /// True if a message at `level` from `module` would be written.
    [[nodiscard]] auto enabled(LogLevel level, std::string_view module) const -> bool;

    void write(LogLevel level, std::string_view module, std::string message,
               const char* file = nullptr, int line = 0);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Sets the fallback threshold; module rules are kept.
    void set_level(LogLevel level);

    auto set_filter(std::string_view rules) -> Result<size_t>;

    void flush();

private:
    Logger();

    mutable std::mutex mutex_;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads the logging options from a full `argv` and falls back to the
/// `CMSCRIPT_LOG` environment variable when none set a level or filter.
///
/// | Option              | Effect                               |
/// |---------------------|--------------------------------------|
/// | `--log-level=L`     | fallback threshold                   |
/// | `--log-filter=R`    | module rules                         |
/// | `--log-file=P`      | also log to file P                   |
/// | `--log-format=F`    | `text` or `json`                     |
/// | `-v` `-vv` `-vvv`   | Info, Debug, Trace                   |
/// | `--verbose`         | same as `-v`                         |
/// | `-q`, `--quiet`     | Error                                |
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// True if `arg` is consumed by `parse_log_options()`. Commands skip these
/// when reading their own arguments.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

} // namespace cmscript::log

// ============================================================================
// Macros
// ============================================================================

#ifndef CMSCRIPT_MIN_LOG_LEVEL
#define CMSCRIPT_MIN_LOG_LEVEL 0
#endif

#define CMSCRIPT_LOG(level, module, msg)                                                           \
    do {                                                                                           \
        if (static_cast<int>(level) >= CMSCRIPT_MIN_LOG_LEVEL &&                                   \
            ::cmscript::log::Logger::instance().enabled(level, module)) {                          \
            std::ostringstream cmscript_log_message_;                                              \
            cmscript_log_message_ << msg;                                                          \
            ::cmscript::log::Logger::instance().write(level, module, cmscript_log_message_.str(),  \
                                                      __FILE__, __LINE__);                         \
        }                                                                                          \
    } while (0)

#define CMSCRIPT_LOG_TRACE(module, msg) CMSCRIPT_LOG(::cmscript::log::LogLevel::Trace, module, msg)
#define CMSCRIPT_LOG_DEBUG(module, msg) CMSCRIPT_LOG(::cmscript::log::LogLevel::Debug, module, msg)
#define CMSCRIPT_LOG_INFO(module, msg) CMSCRIPT_LOG(::cmscript::log::LogLevel::Info, module, msg)
#define CMSCRIPT_LOG_WARN(module, msg) CMSCRIPT_LOG(::cmscript::log::LogLevel::Warn, module, msg)
#define CMSCRIPT_LOG_ERROR(module, msg) CMSCRIPT_LOG(::cmscript::log::LogLevel::Error, module, msg)
#define CMSCRIPT_LOG_FATAL(module, msg) CMSCRIPT_LOG(::cmscript::log::LogLevel::Fatal, module, msg)

#endif // CMSCRIPT_LOG_LOG_HPP
