//! # Format Command
//!
//! Implements `cmscript fmt`.
//!
//! ## Usage
//!
//! ```bash
//! cmscript fmt                       # Format all scripts under the current dir
//! cmscript fmt cmake/ CMakeLists.txt # Format a directory and a file
//! cmscript fmt --check               # Report, change nothing
//! cmscript fmt --stdout foo.cmake    # Print the formatted text
//! ```
//!
//! ## Process
//!
//! 1. Files named on the command line are formatted directly
//! 2. Directories are searched for scripts, which are formatted in parallel
//! 3. Each directory keeps its own `.cmscript-cache` unless `--no-cache`

#include "cmd_format.hpp"

#include "cli/diagnostic.hpp"
#include "cli/format_cache.hpp"
#include "cli/parallel_format.hpp"
#include "cli/utils.hpp"
#include "format/formatter.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

namespace cmscript::cli {

// ============================================================================
// Argument Parsing
// ============================================================================

Result<FmtOptions, std::string> parse_fmt_args(int argc, char* argv[]) {
    FmtOptions options;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--check") {
            options.check_only = true;
        } else if (arg == "--stdout") {
            options.to_stdout = true;
        } else if (arg == "--no-cache") {
            options.no_cache = true;
        } else if (arg.rfind("--jobs=", 0) == 0) {
            auto jobs = parse_uint(std::string_view(arg).substr(7));
            if (!jobs) {
                return "Invalid job count: " + arg.substr(7);
            }
            options.jobs = *jobs;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "Unknown option for fmt: " + arg;
        } else {
            options.paths.push_back(arg);
        }
    }

    if (options.check_only && options.to_stdout) {
        return std::string("--check and --stdout cannot be combined");
    }
    return options;
}

// ============================================================================
// Discovery
// ============================================================================

bool is_cmake_script(const fs::path& path) {
    return path.filename() == "CMakeLists.txt" || path.extension() == ".cmake";
}

static bool is_skipped_directory(const fs::path& dir) {
    auto name = dir.filename().string();
    if (name.size() > 1 && name[0] == '.') {
        return true;
    }
    std::error_code ec;
    return fs::exists(dir / "CMakeCache.txt", ec);
}

std::vector<fs::path> discover_scripts(const fs::path& dir) {
    std::vector<fs::path> scripts;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        CMSCRIPT_LOG_WARN("fmt", "Cannot read " << dir.string() << ": " << ec.message());
        return scripts;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            CMSCRIPT_LOG_WARN("fmt", "Directory walk stopped: " << ec.message());
            break;
        }
        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            if (is_skipped_directory(entry.path())) {
                CMSCRIPT_LOG_DEBUG("fmt", "Skipping " << entry.path().string());
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(ec) && is_cmake_script(entry.path())) {
            scripts.push_back(entry.path());
        }
    }

    std::sort(scripts.begin(), scripts.end());
    return scripts;
}

// ============================================================================
// Formatting
// ============================================================================

/// Prints the formatted text of one file.
static int run_fmt_stdout(const std::string& path, const format::FormatOptions& format) {
    auto& diag = get_diagnostic_emitter();

    auto loaded = lexer::Source::from_file(path);
    if (is_err(loaded)) {
        diag.error(ErrorCodes::FILE_NOT_FOUND, unwrap_err(loaded));
        return ExitCode::Failure;
    }
    std::string content(unwrap(loaded).content());

    auto formatted = format::format_source(content, format);
    if (is_err(formatted)) {
        diag.syntax_error(path, content, unwrap_err(formatted));
        return ExitCode::Failure;
    }

    std::cout << unwrap(formatted);
    return ExitCode::Ok;
}

/// Formats every script under a directory.
static int run_fmt_directory(const fs::path& dir, const FmtOptions& options,
                             const Config& config) {
    auto scripts = discover_scripts(dir);
    if (scripts.empty()) {
        CMSCRIPT_LOG_INFO("fmt", "No CMake scripts found in " << dir.string());
        return ExitCode::Ok;
    }

    std::optional<FormatCache> cache;
    if (config.cache && !options.no_cache) {
        cache.emplace(dir, config.format.fingerprint());
        cache->load();
    }

    FormatFileOptions file_options{.format = config.format,
                                   .check_only = options.check_only,
                                   .verbose = Options::verbose};
    ParallelFormatter formatter(options.jobs.value_or(config.jobs), file_options,
                                cache ? &*cache : nullptr);
    for (const auto& script : scripts) {
        formatter.add_file(script);
    }

    bool ok = formatter.run();
    if (cache && !cache->save()) {
        CMSCRIPT_LOG_WARN("fmt", "Cannot write " << cache->cache_file().string());
    }

    const auto& stats = formatter.get_stats();
    int total = stats.total_files.load();
    int failed = stats.failed.load();
    int needs_formatting = stats.needs_formatting.load();
    if (options.check_only) {
        if (needs_formatting > 0) {
            CMSCRIPT_LOG_WARN("fmt", needs_formatting << " of " << total
                                                      << " files need formatting");
        } else if (failed == 0) {
            CMSCRIPT_LOG_INFO("fmt", "All " << total << " files are correctly formatted");
        }
    } else {
        CMSCRIPT_LOG_INFO("fmt", "Formatted " << stats.reformatted.load() << " of " << total
                                              << " files (" << stats.cached.load()
                                              << " cached, " << failed << " errors)");
    }
    if (failed > 0) {
        CMSCRIPT_LOG_ERROR("fmt", failed << " files could not be formatted");
    }

    return ok ? ExitCode::Ok : ExitCode::Failure;
}

// ============================================================================
// Public Entry Point
// ============================================================================

int run_fmt(const FmtOptions& options, const Config& config) {
    std::vector<std::string> paths = options.paths;
    if (paths.empty()) {
        paths.push_back(".");
    }

    int status = ExitCode::Ok;
    for (const auto& path : paths) {
        std::error_code ec;
        auto status_of = fs::status(path, ec);
        if (ec || !fs::exists(status_of)) {
            get_diagnostic_emitter().error(ErrorCodes::FILE_NOT_FOUND,
                                           "No such file or directory: " + path);
            status = ExitCode::Failure;
            continue;
        }

        int result = ExitCode::Ok;
        if (fs::is_directory(status_of)) {
            if (options.to_stdout) {
                get_diagnostic_emitter().error(ErrorCodes::IO_ERROR,
                                               "--stdout needs a file, got directory " + path);
                result = ExitCode::Failure;
            } else {
                result = run_fmt_directory(path, options, config);
            }
        } else if (options.to_stdout) {
            result = run_fmt_stdout(path, config.format);
        } else {
            FormatFileOptions file_options{.format = config.format,
                                           .check_only = options.check_only,
                                           .verbose = Options::verbose};
            auto outcome = format_file(path, file_options, nullptr);
            if (outcome == FormatOutcome::Failed || outcome == FormatOutcome::NeedsFormatting) {
                result = ExitCode::Failure;
            }
        }

        if (result != ExitCode::Ok) {
            status = result;
        }
    }
    return status;
}

} // namespace cmscript::cli
