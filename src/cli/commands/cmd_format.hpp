//! # Format Command Interface
//!
//! ## Usage
//!
//! - `run_fmt({paths})`: Format files or directories in place
//! - `run_fmt({paths, check_only = true})`: Report files that need formatting
//! - `run_fmt({paths, to_stdout = true})`: Print formatted files

#pragma once

#include "cli/config.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cmscript::cli {

struct FmtOptions {
    std::vector<std::string> paths; // Empty means "."
    bool check_only = false;
    bool to_stdout = false;
    bool no_cache = false;
    std::optional<unsigned> jobs; // Overrides [fmt] jobs
};

/// Parses the arguments after `fmt`. Logging flags are skipped.
Result<FmtOptions, std::string> parse_fmt_args(int argc, char* argv[]);

/// True for `CMakeLists.txt` and `*.cmake`.
bool is_cmake_script(const std::filesystem::path& path);

/// Recursively collects CMake scripts under `dir`, sorted by path.
///
/// Hidden directories and CMake build trees (directories containing a
/// `CMakeCache.txt`) are skipped.
std::vector<std::filesystem::path> discover_scripts(const std::filesystem::path& dir);

// Format command: files are formatted directly, directories through the
// parallel formatter and the format cache
int run_fmt(const FmtOptions& options, const Config& config);

} // namespace cmscript::cli
