//! # CMake Help Registry
//!
//! A `NameRegistry` backed by the `cmake` executable:
//!
//! | Query                 | Command                          |
//! |-----------------------|----------------------------------|
//! | `names(kind)`         | `cmake --help-<kind>-list`       |
//! | `documentation(name)` | `cmake --help-<kind> <name>`     |
//!
//! Listings are fetched on first use and kept for the registry's lifetime.
//! A failing `cmake` yields empty listings and a warning, never an error:
//! completion simply offers nothing.

#pragma once

#include "query/names.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace cmscript::cli {

/// Runs a shell command and returns its combined output and exit code.
using CommandRunner = std::function<std::pair<std::string, int>(const std::string&)>;

/// Runs `cmd` through `popen` with stderr folded into stdout.
std::pair<std::string, int> execute_command(const std::string& cmd);

/// Quotes `arg` for a POSIX shell.
std::string shell_quote(const std::string& arg);

class CMakeHelpRegistry : public query::NameRegistry {
public:
    explicit CMakeHelpRegistry(std::string cmake = "cmake", CommandRunner runner = execute_command);

    std::vector<query::Name> names(query::NameKind kind) const override;

    /// The help text of `name`, or nullopt if cmake has none.
    std::optional<std::string> documentation(const query::Name& name) const;

private:
    std::string cmake_;
    CommandRunner runner_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<query::NameKind, std::vector<query::Name>> listings_;
};

} // namespace cmscript::cli
