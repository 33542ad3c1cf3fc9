//! # Build Configuration
//!
//! This header defines `a2c.toml` parsing.
//!
//! ## Sections
//!
//! | Section       | Keys                                                   |
//! |---------------|--------------------------------------------------------|
//! | `[build]`     | `scenario` (`c`, `vm`, `rust`), `output_dir`, `jobs`   |
//! | `[emit]`      | `comments`, `indent`, `guard_prefix`, `instance_guards`|
//! | `[ownership]` | `small_aggregate_limit`                                |
//! | `[log]`       | `level`, `filter`, `file`, `format` (`text`, `json`)   |
//!
//! Every key is optional. Unknown sections and keys are errors.
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML used by the file: section
//! headers, `key = value` pairs with string, integer and boolean values,
//! and `#` comments.

#ifndef A2C_CONFIG_BUILD_CONFIG_HPP
#define A2C_CONFIG_BUILD_CONFIG_HPP

#include "driver/compilation_run.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace a2c::config {

/// Parses a scenario name: `c`, `vm` or `rust`.
[[nodiscard]] auto parse_scenario(const std::string& name) -> std::optional<tree::Scenario>;

/**
 * Settings of the [build] section
 */
struct BuildSection {
    tree::Scenario scenario = tree::Scenario::TransC;
    std::string output_dir = "build/c";
    int jobs = 1;
};

/**
 * Settings of the [log] section
 */
struct LogSection {
    log::LogLevel level = log::LogLevel::Warn;
    std::string filter;
    std::string file;
    log::LogFormat format = log::LogFormat::Text;
};

/**
 * Whole build configuration
 */
struct BuildConfig {
    BuildSection build;
    codegen::EmitOptions emit;
    ownership::OwnershipOptions ownership;
    LogSection logging;

    /// Reads and parses `path`. The error is `"<path>: Line N: message"`.
    [[nodiscard]] static auto load(const std::filesystem::path& path)
        -> Result<BuildConfig, std::string>;

    [[nodiscard]] static auto parse(const std::string& content) -> Result<BuildConfig, std::string>;

    [[nodiscard]] auto to_compile_options() const -> driver::CompileOptions;

    /// Logger configuration; `A2C_LOG` still applies on top of it.
    [[nodiscard]] auto log_config() const -> log::LogConfig;
};

/**
 * Simple TOML parser for build configuration
 *
 * Supports:
 * - Sections: [section]
 * - Key-value pairs: key = "value"
 * - Numbers: key = 123
 * - Booleans: key = true
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse TOML content into a configuration
     */
    std::optional<BuildConfig> parse();

    /**
     * Get error message if parsing failed
     */
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    // Helper methods
    void skip_whitespace();
    void skip_comment();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();
    bool failed() const {
        return !error_message_.empty();
    }

    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int> parse_number();
    std::optional<bool> parse_boolean();

    // Reads `key =` and leaves the cursor on the value; empty key at a
    // section header or the end of input
    std::optional<std::string> parse_key();

    // Only a comment or a line break may follow a value
    bool expect_line_end();

    bool parse_build_section(BuildSection& build);
    bool parse_emit_section(codegen::EmitOptions& emit);
    bool parse_ownership_section(ownership::OwnershipOptions& options);
    bool parse_log_section(LogSection& logging);

    void set_error(const std::string& message);
};

} // namespace a2c::config

#endif // A2C_CONFIG_BUILD_CONFIG_HPP
