#include "config/compile_config.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace strata::config {

namespace {

enum class Section { None, Compile, Log, Other };

/// Parses `true` / `false`; anything else is malformed.
bool parse_bool(const std::string& key, const std::string& value, bool& out) {
    if (value == "true") {
        out = true;
        return true;
    }
    if (value == "false") {
        out = false;
        return true;
    }
    STRATA_LOG_WARN("config", "Expected true or false for " << key << ", got '" << value << "'");
    return false;
}

void apply_compile_key(CompileConfig& config, const std::string& key, const std::string& value) {
    if (key == "tmp-dir") {
        if (value.empty()) {
            STRATA_LOG_WARN("config", "Empty tmp-dir ignored");
            return;
        }
        config.tmp_dir = value;
    } else if (key == "log-file-actions") {
        parse_bool(key, value, config.log_file_actions);
    } else if (key == "profile-filters") {
        parse_bool(key, value, config.profile_filters);
    } else {
        STRATA_LOG_WARN("config", "Unknown key '" << key << "' in [compile]");
    }
}

void apply_log_key(CompileConfig& config, const std::string& key, const std::string& value) {
    if (key == "level") {
        if (!log::is_level_name(value)) {
            STRATA_LOG_WARN("config", "Unknown log level '" << value << "'");
            return;
        }
        config.log_level = log::parse_level(value);
    } else if (key == "filter") {
        config.log_filter = value;
    } else if (key == "file") {
        config.log_file = value;
    } else if (key == "format") {
        if (value == "json") {
            config.log_format = log::LogFormat::JSON;
        } else if (value == "text") {
            config.log_format = log::LogFormat::Text;
        } else {
            STRATA_LOG_WARN("config", "Unknown log format '" << value << "'");
        }
    } else if (key == "colors") {
        parse_bool(key, value, config.log_colors);
    } else {
        STRATA_LOG_WARN("config", "Unknown key '" << key << "' in [log]");
    }
}

} // namespace

log::LogConfig CompileConfig::log_config() const {
    log::LogConfig result;
    result.level = log_level;
    result.filter_spec = log_filter;
    result.log_file = log_file;
    result.format = log_format;
    result.colors = log_colors;
    return result;
}

CompileConfig parse_compile_config(const std::string& text) {
    CompileConfig config;
    Section section = Section::None;

    std::istringstream input(text);
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;

        // Trim whitespace
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos)
            continue;
        line = line.substr(start);
        line.erase(line.find_last_not_of(" \t\r") + 1);

        // Skip comments
        if (line[0] == '#')
            continue;

        // Check for section headers
        if (line[0] == '[') {
            if (line == "[compile]") {
                section = Section::Compile;
            } else if (line == "[log]") {
                section = Section::Log;
            } else {
                section = Section::Other;
            }
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            STRATA_LOG_WARN("config", "strata.toml:" << line_number << ": expected key = value");
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        // Trim
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));

        // Strip trailing comment from unquoted values
        if (!value.empty() && value[0] != '"') {
            size_t hash = value.find('#');
            if (hash != std::string::npos) {
                value.erase(hash);
            }
            value.erase(value.find_last_not_of(" \t") + 1);
        }

        // Remove quotes from string values
        if (!value.empty() && value[0] == '"') {
            size_t close = value.find('"', 1);
            if (close == std::string::npos) {
                STRATA_LOG_WARN("config", "strata.toml:" << line_number
                                                         << ": unterminated string for " << key);
                continue;
            }
            value = value.substr(1, close - 1);
        }

        if (section == Section::Compile) {
            apply_compile_key(config, key, value);
        } else if (section == Section::Log) {
            apply_log_key(config, key, value);
        }
    }

    return config;
}

CompileConfig load_compile_config(const fs::path& project_root) {
    fs::path config_path = project_root / "strata.toml";

    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        STRATA_LOG_DEBUG("config", "No strata.toml in " << project_root.string()
                                                        << ", using defaults");
        CompileConfig config;
        config.tmp_dir = project_root / config.tmp_dir;
        return config;
    }

    std::ifstream file(config_path);
    if (!file) {
        STRATA_LOG_WARN("config", "Cannot read " << config_path.string() << ", using defaults");
        CompileConfig config;
        config.tmp_dir = project_root / config.tmp_dir;
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    CompileConfig config = parse_compile_config(buffer.str());
    if (config.tmp_dir.is_relative()) {
        config.tmp_dir = project_root / config.tmp_dir;
    }
    STRATA_LOG_DEBUG("config", "Loaded " << config_path.string());
    return config;
}

} // namespace strata::config
