//! # CLI Utilities Interface
//!
//! Shared helpers for the command handlers.
//!
//! ## Functions
//!
//! | Function              | Description                         |
//! |-----------------------|-------------------------------------|
//! | `to_forward_slashes()`| Convert backslashes to forward      |
//! | `write_file()`        | Replace a file's content            |
//! | `parse_uint()`        | Parse a non-negative decimal number |
//! | `print_usage()`       | Print CLI help text                 |
//! | `print_version()`     | Print tool version                  |

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cmscript::cli {

/// Exit codes shared by all commands.
namespace ExitCode {
constexpr int Ok = 0;      // Success, or nothing to do
constexpr int Failure = 1; // Errors, or files that need formatting under --check
constexpr int Usage = 2;   // Bad command line
} // namespace ExitCode

// Path utilities
std::string to_forward_slashes(const std::string& path);

// File I/O
bool write_file(const std::string& path, std::string_view content);

// Argument parsing
std::optional<uint32_t> parse_uint(std::string_view text);

// Help text
void print_usage();
void print_version();

} // namespace cmscript::cli
