//! # CLI Command Dispatcher
//!
//! Parses the command line and routes to the command handlers.
//!
//! ## Architecture
//!
//! ```text
//! cmscript_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ fmt            → run_fmt()
//!   ├─ lex            → run_lex()
//!   ├─ parse          → run_parse()
//!   ├─ word           → run_word()
//!   ├─ scope          → run_scope()
//!   ├─ complete       → run_complete()
//!   ├─ help           → run_help()
//!   └─ context        → run_context()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags (`-v`, `-q`, `--log-*`) are accepted by every command and
//! applied before dispatch.

#include "commands/cmd_debug.hpp"
#include "commands/cmd_format.hpp"
#include "commands/cmd_query.hpp"
#include "common.hpp"
#include "config.hpp"
#include "diagnostic.hpp"
#include "driver.hpp"
#include "help_registry.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace cmscript::cli {

/// Loads `cmscript.toml`, falling back to the defaults when it is malformed.
static Config load_config() {
    auto loaded = Config::load_from_current_dir();
    if (is_err(loaded)) {
        CMSCRIPT_LOG_WARN("config", CONFIG_FILE_NAME << ": " << unwrap_err(loaded)
                                                     << " (using defaults)");
        return Config{};
    }
    return std::move(unwrap(loaded));
}

/// Returns the first positional argument after the command, if any.
static std::optional<std::string> first_positional_arg(int argc, char* argv[]) {
    for (int i = 2; i < argc; ++i) {
        if (!log::is_log_option(argv[i])) {
            return std::string(argv[i]);
        }
    }
    return std::nullopt;
}

/// Main entry point for the cmscript CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                          |
/// |------|--------------------------------------------------|
/// | 0    | Success                                          |
/// | 1    | Error, or files need formatting under `--check`  |
/// | 2    | Usage error                                      |
int cmscript_main(int argc, char* argv[]) {
    auto log_config = log::parse_log_options(argc, argv);
    log_config.color = terminal_supports_colors();
    for (const auto& problem : log::Logger::init(log_config)) {
        CMSCRIPT_LOG_WARN("log", problem);
    }

    Options::verbose = log_config.level <= log::LogLevel::Info;
    Options::color = terminal_supports_colors();
    get_diagnostic_emitter().set_color_enabled(Options::color);

    if (argc < 2) {
        print_usage();
        return ExitCode::Usage;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return ExitCode::Ok;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return ExitCode::Ok;
    }

    if (command == "fmt") {
        auto options = parse_fmt_args(argc, argv);
        if (is_err(options)) {
            std::cerr << "Error: " << unwrap_err(options) << "\n";
            std::cerr << "Usage: cmscript fmt [path...] [--check] [--stdout] [--no-cache] "
                         "[--jobs=N]\n";
            return ExitCode::Usage;
        }
        return run_fmt(unwrap(options), load_config());
    }

    if (command == "lex" || command == "parse") {
        auto path = first_positional_arg(argc, argv);
        if (!path) {
            std::cerr << "Usage: cmscript " << command << " <file>\n";
            return ExitCode::Usage;
        }
        return command == "lex" ? run_lex(*path) : run_parse(*path);
    }

    if (command == "word") {
        return run_word(argc, argv);
    }

    if (command == "scope") {
        return run_scope(argc, argv);
    }

    if (command == "context") {
        return run_context(argc, argv);
    }

    if (command == "complete" || command == "help") {
        auto config = load_config();
        CMakeHelpRegistry registry(config.cmake);
        if (command == "complete") {
            return run_complete(argc, argv, registry, std::cout);
        }
        return run_help(argc, argv, registry, std::cout);
    }

    std::cerr << "Error: Unknown command '" << command << "'\n";
    std::cerr << "Run 'cmscript --help' for usage information.\n";
    return ExitCode::Usage;
}

} // namespace cmscript::cli

// Entry point wrapper (outside namespace)
int cmscript_main(int argc, char* argv[]) {
    return cmscript::cli::cmscript_main(argc, argv);
}
