//! # Log Initialization from the Command Line
//!
//! Turns logging-related arguments and the STRATA_LOG environment variable
//! into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace strata::log {

namespace {

/// Counts the v's in -v, -vv, -vvv. Returns 0 for anything else.
int verbosity_flag(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return 0;
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v')
            return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            v_count = std::max(v_count, 1);
        } else {
            v_count = std::max(v_count, verbosity_flag(arg));
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace, unless --log-level was given
    if (!has_cli_level && v_count > 0) {
        config.level = v_count >= 3 ? LogLevel::Trace
                       : v_count == 2 ? LogLevel::Debug
                                      : LogLevel::Info;
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("STRATA_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "rep=debug,*=warn" and "rep,write" are filter specs, "debug" is a level
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos || !is_level_name(env_str)) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace strata::log
