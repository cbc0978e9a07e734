#include "listeners/file_action_logger.hpp"

#include "log/log.hpp"

#include <iomanip>

namespace strata::listeners {

void FileActionLogger::notify(const event::Notification& notification) {
    if (!notification.rep) {
        return;
    }

    if (notification.event == event::Event::CompilationStarted) {
        std::lock_guard<std::mutex> lock(mutex_);
        start_times_[notification.rep] = std::chrono::steady_clock::now();
        return;
    }
    if (notification.event != event::Event::RepWritten) {
        return;
    }

    rep::WriteAction action = rep::WriteAction::Identical;
    if (notification.is_created) {
        action = rep::WriteAction::Created;
    } else if (notification.is_modified) {
        action = rep::WriteAction::Updated;
    }

    double seconds = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = start_times_.find(notification.rep);
        if (it != start_times_.end()) {
            seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - it->second)
                          .count();
        }
    }
    report(action, notification.path, &seconds);
}

void FileActionLogger::finish(const std::vector<const rep::ItemRep*>& reps) {
    for (const auto* rep : reps) {
        if (rep->compiled()) {
            continue;
        }
        for (const auto& [snapshot, raw_path] : rep->raw_paths()) {
            report(rep::WriteAction::Skipped, raw_path, nullptr);
        }
    }
}

std::vector<FileActionLogger::Entry> FileActionLogger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void FileActionLogger::report(rep::WriteAction action, const std::filesystem::path& path,
                              const double* seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({action, path});

    out_ << std::setw(12) << std::right << rep::write_action_name(action) << "  ";
    if (seconds) {
        out_ << "[" << std::fixed << std::setprecision(2) << *seconds << "s]  ";
    }
    out_ << path.string() << "\n";

    STRATA_LOG_DEBUG("write", rep::write_action_name(action) << " " << path.string());
}

} // namespace strata::listeners
