//! # Filter Timing
//!
//! Measures how long each filter runs, from `filtering_started` to
//! `filtering_ended`, and prints a summary per filter name:
//!
//! ```text
//! filter   |  count    min    avg    max     tot
//! ---------+------------------------------------
//! erb      |      3  0.01s  0.02s  0.04s   0.06s
//! markdown |      1  0.10s  0.10s  0.10s   0.10s
//! ```
//!
//! A filter that runs another filter of the same name (e.g. a layout that
//! renders a partial) is timed once per run.

#pragma once

#include "listeners/listener.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace strata::listeners {

class FilterTimingRecorder : public Listener {
public:
    struct Summary {
        size_t count = 0;
        double min = 0.0;
        double avg = 0.0;
        double max = 0.0;
        double total = 0.0;
    };

    void notify(const event::Notification& notification) override;

    /// Manually record one run of `filter_name`.
    void record(const std::string& filter_name, double seconds);

    /// Summary for one filter; `count` is 0 if it never ran.
    Summary summary(const std::string& filter_name) const;

    /// Names of all timed filters, sorted.
    std::vector<std::string> filter_names() const;

    void report(std::ostream& out) const;

private:
    mutable std::mutex mutex_;
    /// Start times of unfinished runs per thread and filter, innermost last.
    std::map<std::pair<std::thread::id, std::string>,
             std::vector<std::chrono::steady_clock::time_point>>
        running_;
    std::map<std::string, std::vector<double>> times_;
};

} // namespace strata::listeners
