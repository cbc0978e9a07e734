//! # Compilation Session
//!
//! Owns everything one compilation run shares: the notification center, the
//! temporary file factory, the dependency tracker and the listeners enabled by
//! the configuration.
//!
//! ```cpp
//! auto config = config::load_compile_config(root);
//! driver::Session session(config, filters);
//! rep::ItemRep rep(item, "default", session.context());
//! auto status = session.compile({{&rep, rule}});
//! ```

#pragma once

#include "config/compile_config.hpp"
#include "deps/dependency_tracker.hpp"
#include "driver/rep_compiler.hpp"
#include "event/notification.hpp"
#include "filter/filter.hpp"
#include "listeners/file_action_logger.hpp"
#include "listeners/filter_timing.hpp"
#include "rep/item_rep.hpp"
#include "rep/temp_filenames.hpp"

#include <iostream>
#include <optional>
#include <vector>

namespace strata::driver {

using config::CompileConfig;

class Session {
public:
    Session(CompileConfig config, const filter::FilterRegistry& filters,
            std::ostream& out = std::cout);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Context for the representations compiled in this session.
    rep::CompileContext context();

    /// Compiles all jobs, then reports skipped files and filter timings and
    /// removes temporary files.
    Status compile(const std::vector<CompileJob>& jobs);

    const CompileConfig& config() const {
        return config_;
    }

    event::NotificationCenter& notifications() {
        return notifications_;
    }

    const deps::DependencyTracker& dependencies() const {
        return dependencies_;
    }

    /// Present when `log-file-actions` is enabled.
    const listeners::FileActionLogger* file_actions() const {
        return file_actions_ ? &*file_actions_ : nullptr;
    }

    /// Present when `profile-filters` is enabled.
    const listeners::FilterTimingRecorder* filter_timings() const {
        return filter_timings_ ? &*filter_timings_ : nullptr;
    }

private:
    CompileConfig config_;
    const filter::FilterRegistry& filters_;
    std::ostream& out_;

    event::NotificationCenter notifications_;
    rep::TempFilenameFactory temp_files_;
    deps::DependencyTracker dependencies_;
    std::optional<listeners::FileActionLogger> file_actions_;
    std::optional<listeners::FilterTimingRecorder> filter_timings_;
};

} // namespace strata::driver
