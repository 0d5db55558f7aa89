//! # Logging Options
//!
//! Turns the logging flags of a command line, and the `CMSCRIPT_LOG`
//! environment variable, into a `LogConfig`.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>

namespace cmscript::log {

namespace {

struct ValueOption {
    std::string_view prefix;
    void (*apply)(LogConfig&, std::string_view);
};

void apply_level(LogConfig& config, std::string_view value) {
    if (auto level = parse_level(value)) {
        config.level = *level;
    } else {
        config.problems.push_back("unknown log level '" + std::string(value) + "'");
    }
}

void apply_filter(LogConfig& config, std::string_view value) {
    config.filter = std::string(value);
}

void apply_file(LogConfig& config, std::string_view value) {
    config.file = std::string(value);
}

void apply_format(LogConfig& config, std::string_view value) {
    if (value == "json") {
        config.format = LogFormat::Json;
    } else if (value == "text") {
        config.format = LogFormat::Text;
    } else {
        config.problems.push_back("unknown log format '" + std::string(value) + "'");
    }
}

constexpr ValueOption VALUE_OPTIONS[] = {
    {"--log-level=", apply_level},
    {"--log-filter=", apply_filter},
    {"--log-file=", apply_file},
    {"--log-format=", apply_format},
};

/// Number of `v`s in `-v`, `-vv`, ...; 1 for `--verbose`; 0 otherwise.
auto verbosity(std::string_view arg) -> int {
    if (arg == "--verbose") {
        return 1;
    }
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto verbosity_level(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

auto is_log_option(std::string_view arg) -> bool {
    for (const auto& option : VALUE_OPTIONS) {
        if (arg.starts_with(option.prefix)) {
            return true;
        }
    }
    return arg == "-q" || arg == "--quiet" || verbosity(arg) > 0;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;
    bool level_set = false;
    bool filter_set = false;
    bool quiet = false;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        bool matched = false;
        for (const auto& option : VALUE_OPTIONS) {
            if (arg.starts_with(option.prefix)) {
                option.apply(config, arg.substr(option.prefix.size()));
                level_set |= option.prefix == "--log-level=";
                filter_set |= option.prefix == "--log-filter=";
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }

        if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    // An explicit --log-level beats -q, which beats -v.
    if (!level_set && quiet) {
        config.level = LogLevel::Error;
        level_set = true;
    } else if (!level_set && verbose > 0) {
        config.level = verbosity_level(verbose);
        level_set = true;
    }

    if (level_set || filter_set) {
        return config;
    }

    // CMSCRIPT_LOG holds either a level name or a rule list.
    const char* env = std::getenv("CMSCRIPT_LOG");
    if (env == nullptr || *env == '\0') {
        return config;
    }
    if (auto level = parse_level(env)) {
        config.level = *level;
    } else {
        config.filter = env;
    }
    return config;
}

} // namespace cmscript::log
