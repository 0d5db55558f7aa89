//! # Logger Implementation
//!
//! Record rendering, the sinks, module thresholds and the process logger.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <unistd.h>

namespace cmscript::log {

namespace {

auto ansi_color(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

void write_json_string(std::ostream& out, std::string_view text) {
    out << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out << buf;
            } else {
                out << c;
            }
        }
    }
    out << '"';
}

void write_clock_time(std::ostream& out, std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch())
                      .count() %
                  1000;
    std::tm local{};
    localtime_r(&seconds, &local);
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << std::setfill(' ');
}

} // namespace

// ============================================================================
// Levels and Rendering
// ============================================================================

auto level_name(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "OFF";
}

auto parse_level(std::string_view text) -> std::optional<LogLevel> {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") {
        return LogLevel::Warn;
    }
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        std::string name(level_name(level));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == lower) {
            return level;
        }
    }
    return std::nullopt;
}

auto render(const LogRecord& record, LogFormat format, bool color) -> std::string {
    std::ostringstream out;

    if (format == LogFormat::Json) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      record.time.time_since_epoch())
                      .count();
        out << "{\"time\":" << ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":";
        write_json_string(out, record.module);
        out << ",\"msg\":";
        write_json_string(out, record.message);
        if (record.file != nullptr) {
            out << ",\"at\":";
            write_json_string(out, std::string(record.file) + ":" + std::to_string(record.line));
        }
        out << "}\n";
        return out.str();
    }

    write_clock_time(out, record.time);
    out << ' ';
    if (color) {
        out << ansi_color(record.level);
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (color) {
        out << "\033[0m";
    }
    out << " [" << record.module << "] " << record.message << '\n';
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

StreamSink::StreamSink(std::ostream& out, LogFormat format, bool color)
    : out_(out), format_(format), color_(color) {}

void StreamSink::write(const LogRecord& record) {
    out_ << render(record, format_, color_);
}

void StreamSink::flush() {
    out_.flush();
}

FileSink::FileSink(std::ofstream file, LogFormat format)
    : file_(std::move(file)), format_(format) {}

auto FileSink::open(const std::string& path, LogFormat format, bool append)
    -> Result<std::unique_ptr<FileSink>> {
    std::ofstream file(path, append ? std::ios::app : std::ios::trunc);
    if (!file) {
        return "cannot open log file " + path;
    }
    return std::unique_ptr<FileSink>(new FileSink(std::move(file), format));
}

void FileSink::write(const LogRecord& record) {
    file_ << render(record, format_);
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    file_.flush();
}

void MemorySink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

auto MemorySink::records() const -> std::vector<LogRecord> {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

// ============================================================================
// LogFilter
// ============================================================================

auto LogFilter::parse(std::string_view rules) -> Result<size_t> {
    size_t added = 0;
    size_t start = 0;
    while (start <= rules.size()) {
        auto comma = std::min(rules.find(',', start), rules.size());
        auto rule = rules.substr(start, comma - start);
        start = comma + 1;

        if (rule.empty()) {
            continue;
        }

        auto eq = rule.find('=');
        auto module = rule.substr(0, eq);
        auto level = LogLevel::Trace;
        if (eq != std::string_view::npos) {
            auto parsed = parse_level(rule.substr(eq + 1));
            if (!parsed || module.empty()) {
                return "malformed log filter rule '" + std::string(rule) + "'";
            }
            level = *parsed;
        }

        if (module == "*") {
            fallback_ = level;
        } else {
            std::erase_if(rules_, [module](const auto& entry) { return entry.first == module; });
            rules_.emplace_back(module, level);
        }
        added++;
    }
    return added;
}

auto LogFilter::threshold(std::string_view module) const -> LogLevel {
    for (const auto& [name, level] : rules_) {
        if (name == module) {
            return level;
        }
    }
    return fallback_;
}

auto LogFilter::lowest() const -> LogLevel {
    auto lowest = fallback_;
    for (const auto& [_, level] : rules_) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<StreamSink>());
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::init(const LogConfig& config) -> std::vector<std::string> {
    std::vector<std::string> problems = config.problems;

    LogFilter filter(config.level);
    if (!config.filter.empty()) {
        auto parsed = filter.parse(config.filter);
        if (is_err(parsed)) {
            problems.push_back(unwrap_err(parsed));
        }
    }

    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        bool color = config.color && isatty(fileno(stderr)) != 0;
        sinks.push_back(std::make_unique<StreamSink>(std::cerr, config.format, color));
    }
    if (!config.file.empty()) {
        auto opened = FileSink::open(config.file, config.format);
        if (is_ok(opened)) {
            sinks.push_back(std::move(unwrap(opened)));
        } else {
            problems.push_back(unwrap_err(opened));
        }
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.filter_ = std::move(filter);
    logger.sinks_ = std::move(sinks);
    return problems;
}

auto Logger::enabled(LogLevel level, std::string_view module) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return !sinks_.empty() && filter_.allows(level, module);
}

void Logger::write(LogLevel level, std::string_view module, std::string message,
                   const char* file, int line) {
    LogRecord record{.level = level,
                     .module = std::string(module),
                     .message = std::move(message),
                     .file = file,
                     .line = line,
                     .time = std::chrono::system_clock::now()};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_fallback(level);
}

auto Logger::set_filter(std::string_view rules) -> Result<size_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.parse(rules);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace cmscript::log
