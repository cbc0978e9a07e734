//! # File Action Logger
//!
//! Prints what happened to every output file:
//!
//! ```text
//!       create  [0.02s]  output/index.html
//!       update  [0.01s]  output/about/index.html
//!    identical  [0.00s]  output/style.css
//!         skip  output/feed.xml
//! ```
//!
//! `skip` lines are printed by `finish()` for representations that were not
//! compiled in this run.

#pragma once

#include "listeners/listener.hpp"
#include "rep/item_rep.hpp"
#include "rep/rep_writer.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace strata::listeners {

class FileActionLogger : public Listener {
public:
    struct Entry {
        rep::WriteAction action;
        std::filesystem::path path;
    };

    explicit FileActionLogger(std::ostream& out = std::cout) : out_(out) {}

    void notify(const event::Notification& notification) override;

    /// Reports every raw path of the representations in `reps` that were not
    /// compiled as skipped.
    void finish(const std::vector<const rep::ItemRep*>& reps);

    /// Everything reported so far.
    std::vector<Entry> entries() const;

private:
    void report(rep::WriteAction action, const std::filesystem::path& path,
                const double* seconds);

    std::ostream& out_;
    mutable std::mutex mutex_;
    std::unordered_map<const rep::ItemRep*, std::chrono::steady_clock::time_point> start_times_;
    std::vector<Entry> entries_;
};

} // namespace strata::listeners
