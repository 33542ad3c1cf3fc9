//! # Log Initialization from the Environment
//!
//! Reads the A2C_LOG environment variable into a LogConfig. Explicit
//! configuration (from `a2c.toml`) always takes precedence.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace a2c::log {

void apply_env_overrides(LogConfig& config) {
    if (!config.filter_spec.empty()) {
        return;
    }

    const char* env_log = std::getenv("A2C_LOG");
    if (!env_log) {
        return;
    }
    std::string env_str = env_log;
    if (env_str.empty()) {
        return;
    }

    // "mono=trace,*=warn" or "mono,layout" are filter specs, anything else a level
    if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
        config.filter_spec = env_str;
    } else if (auto level = try_parse_level(env_str)) {
        config.level = *level;
    } else {
        config.filter_spec = env_str;
    }
}

} // namespace a2c::log
