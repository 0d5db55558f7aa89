#include "help_registry.hpp"

#include "log/log.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace cmscript::cli {

std::pair<std::string, int> execute_command(const std::string& cmd) {
    std::string output;
    int exit_code = -1;

    FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
    if (pipe) {
        char buffer[4096];
        while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
            output += buffer;
        }
        int status = pclose(pipe);
        exit_code = WEXITSTATUS(status);
    }

    return {output, exit_code};
}

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CMakeHelpRegistry::CMakeHelpRegistry(std::string cmake, CommandRunner runner)
    : cmake_(std::move(cmake)), runner_(std::move(runner)) {}

std::vector<query::Name> CMakeHelpRegistry::names(query::NameKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = listings_.find(kind);
    if (it != listings_.end()) {
        return it->second;
    }

    auto tag = std::string(query::name_kind_to_string(kind));
    auto cmd = shell_quote(cmake_) + " --help-" + tag + "-list";
    CMSCRIPT_LOG_DEBUG("help", "Running " << cmd);

    auto [output, exit_code] = runner_(cmd);
    query::StaticNameRegistry parsed;
    if (exit_code != 0) {
        CMSCRIPT_LOG_WARN("help", "'" << cmd << "' exited with code " << exit_code);
    } else {
        parsed.add_listing(output, kind);
    }

    auto [inserted, _] = listings_.emplace(kind, parsed.names(kind));
    return inserted->second;
}

std::optional<std::string> CMakeHelpRegistry::documentation(const query::Name& name) const {
    auto tag = std::string(query::name_kind_to_string(name.kind));
    auto cmd = shell_quote(cmake_) + " --help-" + tag + " " + shell_quote(name.name);
    CMSCRIPT_LOG_DEBUG("help", "Running " << cmd);

    auto [output, exit_code] = runner_(cmd);
    if (exit_code != 0 || output.empty()) {
        CMSCRIPT_LOG_WARN("help", "No documentation for " << tag << " '" << name.name << "'");
        return std::nullopt;
    }
    return output;
}

} // namespace cmscript::cli
