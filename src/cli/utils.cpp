#include "utils.hpp"

#include "common.hpp"

#include <charconv>
#include <fstream>
#include <iostream>

namespace cmscript::cli {

std::string to_forward_slashes(const std::string& path) {
    std::string result = path;
    for (char& c : result) {
        if (c == '\\')
            c = '/';
    }
    return result;
}

bool write_file(const std::string& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

std::optional<uint32_t> parse_uint(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

void print_usage() {
    std::cout << "cmscript " << VERSION << " - CMake script formatter and query tool\n\n";
    std::cout << "Usage: cmscript <command> [options] [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  fmt [path...]               Format files or directories in place\n";
    std::cout << "  lex <file>                  Print the token stream (debug)\n";
    std::cout << "  parse <file>                Print the syntax tree (debug)\n";
    std::cout << "  word <file> <line> <col>    Print the identifier under the cursor\n";
    std::cout << "  scope <file> <line> <col>   Print the scope kind and typed prefix\n";
    std::cout << "  complete <file> <line> <col>\n";
    std::cout << "                              List completion candidates\n";
    std::cout << "  help <file> <line> <col>    Show CMake documentation for the word\n";
    std::cout << "  context <file> <offset>     Print the command and argument index\n";
    std::cout << "\nLines and columns are 0-based; offsets are byte offsets.\n";
    std::cout << "\nFormat options:\n";
    std::cout << "  --check          Report files that need formatting, change nothing\n";
    std::cout << "  --stdout         Print the formatted text instead of writing it\n";
    std::cout << "  --no-cache       Ignore and do not update .cmscript-cache\n";
    std::cout << "  --jobs=N         Worker threads for directories (0 = all cores)\n";
    std::cout << "\nLogging options:\n";
    std::cout << "  -v, -vv, -vvv    Raise log verbosity (info, debug, trace)\n";
    std::cout << "  --verbose        Same as -v\n";
    std::cout << "  -q, --quiet      Only print errors\n";
    std::cout << "  --log-level=L    trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=F   Per-module levels, e.g. \"parse=trace,*=warn\"\n";
    std::cout << "  --log-file=P     Also write log records to P\n";
    std::cout << "  --log-format=F   text or json\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h       Show this help\n";
    std::cout << "  --version, -V    Show version\n";
}

void print_version() {
    std::cout << "cmscript " << VERSION << "\n";
}

} // namespace cmscript::cli
