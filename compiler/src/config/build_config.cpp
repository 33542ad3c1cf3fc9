#include "config/build_config.hpp"

#include <cctype>
#include <fstream>

namespace a2c::config {

auto parse_scenario(const std::string& name) -> std::optional<tree::Scenario> {
    if (name == "c")
        return tree::Scenario::TransC;
    if (name == "vm")
        return tree::Scenario::Interp;
    if (name == "rust")
        return tree::Scenario::TransRust;
    return std::nullopt;
}

namespace {

bool is_c_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])))
        return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
            return false;
    }
    return true;
}

} // namespace

// ============================================================================
// BuildConfig
// ============================================================================

auto BuildConfig::load(const std::filesystem::path& path) -> Result<BuildConfig, std::string> {
    std::ifstream file(path);
    if (!file) {
        return path.string() + ": cannot open file";
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto parsed = parse(content);
    if (is_err(parsed)) {
        return path.string() + ": " + unwrap_err(parsed);
    }
    A2C_LOG_DEBUG("config", "Loaded " << path.string());
    return unwrap(parsed);
}

auto BuildConfig::parse(const std::string& content) -> Result<BuildConfig, std::string> {
    SimpleTomlParser parser(content);
    auto config = parser.parse();
    if (!config) {
        A2C_LOG_DEBUG("config", "Rejected configuration: " << parser.get_error());
        return parser.get_error();
    }
    return *config;
}

auto BuildConfig::to_compile_options() const -> driver::CompileOptions {
    driver::CompileOptions options;
    options.scenario = build.scenario;
    options.emit = emit;
    options.ownership = ownership;
    return options;
}

auto BuildConfig::log_config() const -> log::LogConfig {
    log::LogConfig config;
    config.level = logging.level;
    config.format = logging.format;
    config.filter_spec = logging.filter;
    config.log_file = logging.file;
    return config;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content) : content_(content) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

std::string SimpleTomlParser::parse_identifier() {
    std::string result;
    while (!is_eof() &&
           (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')) {
        result += advance();
    }
    return result;
}

std::optional<std::string> SimpleTomlParser::parse_string() {
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
                set_error(std::string("Unknown escape '\\") + escaped + "'");
                return std::nullopt;
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

std::optional<int> SimpleTomlParser::parse_number() {
    std::string digits;
    while (!is_eof() && std::isdigit(static_cast<unsigned char>(peek()))) {
        digits += advance();
    }
    if (digits.empty()) {
        set_error("Expected number");
        return std::nullopt;
    }
    if (digits.size() > 9) {
        set_error("Number too large: " + digits);
        return std::nullopt;
    }
    return std::stoi(digits);
}

std::optional<bool> SimpleTomlParser::parse_boolean() {
    std::string value = parse_identifier();
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    set_error("Expected true or false");
    return std::nullopt;
}

std::optional<std::string> SimpleTomlParser::parse_key() {
    while (true) {
        skip_whitespace();
        if (peek() != '#')
            break;
        skip_comment();
    }
    if (is_eof() || peek() == '[')
        return std::string{};

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

bool SimpleTomlParser::expect_line_end() {
    while (peek() == ' ' || peek() == '\t' || peek() == '\r')
        advance();
    skip_comment();
    if (!is_eof() && peek() != '\n') {
        set_error("Unexpected characters after value");
        return false;
    }
    return true;
}

void SimpleTomlParser::set_error(const std::string& message) {
    error_message_ = "Line " + std::to_string(line_) + ": " + message;
}

bool SimpleTomlParser::parse_build_section(BuildSection& build) {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;

        if (*key == "scenario") {
            auto name = parse_string();
            if (!name)
                return false;
            auto scenario = parse_scenario(*name);
            if (!scenario) {
                set_error("Unknown scenario '" + *name + "' (expected c, vm or rust)");
                return false;
            }
            build.scenario = *scenario;
        } else if (*key == "output_dir") {
            auto dir = parse_string();
            if (!dir)
                return false;
            build.output_dir = *dir;
        } else if (*key == "jobs") {
            auto jobs = parse_number();
            if (!jobs)
                return false;
            if (*jobs < 1) {
                set_error("jobs must be at least 1");
                return false;
            }
            build.jobs = *jobs;
        } else {
            set_error("Unknown key '" + *key + "' in [build]");
            return false;
        }
        if (!expect_line_end())
            return false;
    }
}

bool SimpleTomlParser::parse_emit_section(codegen::EmitOptions& emit) {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;

        if (*key == "comments") {
            auto value = parse_boolean();
            if (!value)
                return false;
            emit.emit_comments = *value;
        } else if (*key == "indent") {
            auto width = parse_number();
            if (!width)
                return false;
            if (*width < 1 || *width > 8) {
                set_error("indent must be between 1 and 8");
                return false;
            }
            emit.indent_width = *width;
        } else if (*key == "guard_prefix") {
            auto prefix = parse_string();
            if (!prefix)
                return false;
            if (!is_c_identifier(*prefix)) {
                set_error("guard_prefix must be a C identifier");
                return false;
            }
            emit.guard_prefix = *prefix;
        } else if (*key == "instance_guards") {
            auto value = parse_boolean();
            if (!value)
                return false;
            emit.instance_guards = *value;
        } else {
            set_error("Unknown key '" + *key + "' in [emit]");
            return false;
        }
        if (!expect_line_end())
            return false;
    }
}

bool SimpleTomlParser::parse_ownership_section(ownership::OwnershipOptions& options) {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;

        if (*key == "small_aggregate_limit") {
            auto limit = parse_number();
            if (!limit)
                return false;
            options.small_aggregate_limit = static_cast<size_t>(*limit);
        } else {
            set_error("Unknown key '" + *key + "' in [ownership]");
            return false;
        }
        if (!expect_line_end())
            return false;
    }
}

bool SimpleTomlParser::parse_log_section(LogSection& logging) {
    while (true) {
        auto key = parse_key();
        if (!key)
            return false;
        if (key->empty())
            return true;

        if (*key == "level") {
            auto name = parse_string();
            if (!name)
                return false;
            auto level = log::try_parse_level(*name);
            if (!level) {
                set_error("Unknown log level '" + *name + "'");
                return false;
            }
            logging.level = *level;
        } else if (*key == "filter") {
            auto filter = parse_string();
            if (!filter)
                return false;
            logging.filter = *filter;
        } else if (*key == "file") {
            auto file = parse_string();
            if (!file)
                return false;
            logging.file = *file;
        } else if (*key == "format") {
            auto format = parse_string();
            if (!format)
                return false;
            if (*format == "text") {
                logging.format = log::LogFormat::Text;
            } else if (*format == "json") {
                logging.format = log::LogFormat::JSON;
            } else {
                set_error("Unknown log format '" + *format + "' (expected text or json)");
                return false;
            }
        } else {
            set_error("Unknown key '" + *key + "' in [log]");
            return false;
        }
        if (!expect_line_end())
            return false;
    }
}

std::optional<BuildConfig> SimpleTomlParser::parse() {
    BuildConfig config;

    while (true) {
        // Keys before the first section header are not allowed
        auto stray = parse_key();
        if (!stray)
            return std::nullopt;
        if (!stray->empty()) {
            set_error("Key '" + *stray + "' outside of a section");
            return std::nullopt;
        }
        if (is_eof())
            break;

        advance(); // Skip '['
        std::string section = parse_identifier();
        if (peek() != ']') {
            set_error("Expected ']' after section name");
            return std::nullopt;
        }
        advance(); // Skip ']'
        if (!expect_line_end())
            return std::nullopt;

        bool ok = false;
        if (section == "build") {
            ok = parse_build_section(config.build);
        } else if (section == "emit") {
            ok = parse_emit_section(config.emit);
        } else if (section == "ownership") {
            ok = parse_ownership_section(config.ownership);
        } else if (section == "log") {
            ok = parse_log_section(config.logging);
        } else {
            set_error("Unknown section [" + section + "]");
        }
        if (!ok)
            return std::nullopt;
    }

    return config;
}

} // namespace a2c::config
