//! # Compile Configuration
//!
//! Settings read from `strata.toml` in the project root.
//!
//! ```toml
//! [compile]
//! tmp-dir = "tmp/strata"
//! log-file-actions = true
//! profile-filters = false
//!
//! [log]
//! level = "info"
//! filter = "rep=debug,write=info"
//! file = "strata.log"
//! format = "text"     # or "json"
//! colors = true
//! ```
//!
//! A missing file yields the defaults. Unknown keys and malformed values are
//! reported as warnings and leave the default in place.

#pragma once

#include "log/log.hpp"

#include <filesystem>
#include <string>

namespace strata::config {

struct CompileConfig {
    // [compile]
    std::filesystem::path tmp_dir = "tmp/strata";
    bool log_file_actions = true;
    bool profile_filters = false;

    // [log]
    log::LogLevel log_level = log::LogLevel::Warn;
    std::string log_filter;
    std::string log_file;
    log::LogFormat log_format = log::LogFormat::Text;
    bool log_colors = true;

    /// The `[log]` section as a logger configuration.
    log::LogConfig log_config() const;
};

/// Loads the configuration from strata.toml in `project_root`. A relative
/// `tmp-dir` is resolved against `project_root`.
CompileConfig load_compile_config(const std::filesystem::path& project_root);

/// Parses configuration text. Used by `load_compile_config`.
CompileConfig parse_compile_config(const std::string& text);

} // namespace strata::config
