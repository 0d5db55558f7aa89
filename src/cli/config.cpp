#include "config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace cmscript::cli {

// ============================================================================
// Config
// ============================================================================

Result<Config, std::string> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Config{};
    }

    std::ifstream file(path);
    if (!file) {
        return "Cannot open " + path.string();
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    ConfigParser parser(content);
    auto config = parser.parse();
    if (!config) {
        return parser.get_error();
    }
    CMSCRIPT_LOG_DEBUG("config", "Loaded " << path.string() << " ("
                                           << config->format.fingerprint() << ")");
    return std::move(*config);
}

Result<Config, std::string> Config::load_from_current_dir() {
    return load(fs::current_path() / CONFIG_FILE_NAME);
}

// ============================================================================
// ConfigParser
// ============================================================================

ConfigParser::ConfigParser(const std::string& content) : content_(content), pos_(0), line_(1) {}

void ConfigParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void ConfigParser::skip_comment() {
    while (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
        skip_whitespace();
    }
}

char ConfigParser::advance() {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

std::string ConfigParser::parse_identifier() {
    std::string result;
    while (!is_eof() &&
           (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')) {
        result += advance();
    }
    return result;
}

std::optional<std::string> ConfigParser::parse_string() {
    if (peek() != '"') {
        set_error("Expected string");
        return std::nullopt;
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                result += escaped;
                break;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return std::nullopt;
    }
    advance(); // Skip closing quote

    return result;
}

std::optional<int> ConfigParser::parse_number() {
    std::string num_str;
    while (!is_eof() && std::isdigit(static_cast<unsigned char>(peek())) && num_str.size() < 9) {
        num_str += advance();
    }
    if (num_str.empty() || std::isdigit(static_cast<unsigned char>(peek()))) {
        set_error("Expected a non-negative integer");
        return std::nullopt;
    }
    return std::stoi(num_str);
}

std::optional<bool> ConfigParser::parse_boolean() {
    std::string value = parse_identifier();
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    set_error("Expected 'true' or 'false', found '" + value + "'");
    return std::nullopt;
}

bool ConfigParser::skip_value() {
    if (peek() == '"') {
        return parse_string().has_value();
    }
    while (!is_eof() && peek() != '\n' && peek() != '#') {
        advance();
    }
    return true;
}

void ConfigParser::set_error(const std::string& message) {
    error_message_ = "Line " + std::to_string(line_) + ": " + message;
}

std::optional<std::string> ConfigParser::next_key() {
    skip_whitespace();
    skip_comment();

    if (peek() == '[' || is_eof())
        return std::nullopt;

    std::string key = parse_identifier();
    if (key.empty()) {
        set_error(std::string("Unexpected character '") + peek() + "'");
        return std::nullopt;
    }

    while (peek() == ' ' || peek() == '\t')
        advance();

    if (peek() != '=') {
        set_error("Expected '=' after key");
        return std::nullopt;
    }
    advance();
    while (peek() == ' ' || peek() == '\t')
        advance();

    return key;
}

bool ConfigParser::parse_format_section(format::FormatOptions& options) {
    while (auto key = next_key()) {
        if (*key == "max-blank-lines") {
            auto value = parse_number();
            if (!value)
                return false;
            options.max_blank_lines = *value;
        } else if (*key == "max-argument-blank-lines") {
            auto value = parse_number();
            if (!value)
                return false;
            options.max_argument_blank_lines = *value;
        } else {
            CMSCRIPT_LOG_WARN("config", "Line " << line_ << ": unknown key 'format." << *key
                                                << "'");
            if (!skip_value())
                return false;
        }
    }
    return error_message_.empty();
}

bool ConfigParser::parse_fmt_section(Config& config) {
    while (auto key = next_key()) {
        if (*key == "cache") {
            auto value = parse_boolean();
            if (!value)
                return false;
            config.cache = *value;
        } else if (*key == "jobs") {
            auto value = parse_number();
            if (!value)
                return false;
            config.jobs = static_cast<unsigned>(*value);
        } else {
            CMSCRIPT_LOG_WARN("config", "Line " << line_ << ": unknown key 'fmt." << *key << "'");
            if (!skip_value())
                return false;
        }
    }
    return error_message_.empty();
}

bool ConfigParser::parse_query_section(Config& config) {
    while (auto key = next_key()) {
        if (*key == "cmake") {
            auto value = parse_string();
            if (!value)
                return false;
            config.cmake = *value;
        } else {
            CMSCRIPT_LOG_WARN("config",
                              "Line " << line_ << ": unknown key 'query." << *key << "'");
            if (!skip_value())
                return false;
        }
    }
    return error_message_.empty();
}

bool ConfigParser::parse_unknown_section() {
    while (next_key()) {
        if (!skip_value())
            return false;
    }
    return error_message_.empty();
}

std::optional<Config> ConfigParser::parse() {
    Config config;

    while (!is_eof()) {
        skip_whitespace();
        skip_comment();

        if (is_eof())
            break;

        if (peek() != '[') {
            // Keys before the first section header
            if (!parse_unknown_section())
                return std::nullopt;
            continue;
        }
        advance(); // Skip '['

        std::string section = parse_identifier();
        if (peek() != ']') {
            set_error("Expected ']' after section name");
            return std::nullopt;
        }
        advance(); // Skip ']'

        bool ok = false;
        if (section == "format") {
            ok = parse_format_section(config.format);
        } else if (section == "fmt") {
            ok = parse_fmt_section(config);
        } else if (section == "query") {
            ok = parse_query_section(config);
        } else {
            CMSCRIPT_LOG_WARN("config", "Line " << line_ << ": unknown section [" << section
                                                << "]");
            ok = parse_unknown_section();
        }
        if (!ok)
            return std::nullopt;
    }

    return config;
}

} // namespace cmscript::cli
