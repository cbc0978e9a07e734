#include "listeners/filter_timing.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <thread>

namespace strata::listeners {

void FilterTimingRecorder::notify(const event::Notification& notification) {
    if (notification.event == event::Event::FilteringStarted) {
        std::lock_guard<std::mutex> lock(mutex_);
        running_[{std::this_thread::get_id(), notification.filter_name}].push_back(
            std::chrono::steady_clock::now());
        return;
    }
    if (notification.event != event::Event::FilteringEnded) {
        return;
    }

    double seconds = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = running_.find({std::this_thread::get_id(), notification.filter_name});
        if (it == running_.end() || it->second.empty()) {
            return;
        }
        seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                                it->second.back())
                      .count();
        it->second.pop_back();
        if (it->second.empty()) {
            running_.erase(it);
        }
    }
    record(notification.filter_name, seconds);
}

void FilterTimingRecorder::record(const std::string& filter_name, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    times_[filter_name].push_back(seconds);
}

FilterTimingRecorder::Summary FilterTimingRecorder::summary(const std::string& filter_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Summary result;
    auto it = times_.find(filter_name);
    if (it == times_.end() || it->second.empty()) {
        return result;
    }

    const auto& times = it->second;
    result.count = times.size();
    result.min = *std::min_element(times.begin(), times.end());
    result.max = *std::max_element(times.begin(), times.end());
    result.total = std::accumulate(times.begin(), times.end(), 0.0);
    result.avg = result.total / static_cast<double>(result.count);
    return result;
}

std::vector<std::string> FilterTimingRecorder::filter_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : times_) {
        names.push_back(name);
    }
    return names;
}

void FilterTimingRecorder::report(std::ostream& out) const {
    auto names = filter_names();
    if (names.empty()) {
        return;
    }

    size_t width = std::string("filter").size();
    for (const auto& name : names) {
        width = std::max(width, name.size());
    }

    out << "\n" << std::setw(static_cast<int>(width)) << std::left << "filter"
        << " |  count    min    avg    max     tot\n";
    out << std::string(width, '-') << "-+" << std::string(36, '-') << "\n";

    for (const auto& name : names) {
        auto s = summary(name);
        out << std::setw(static_cast<int>(width)) << std::left << name << " | " << std::right
            << std::setw(6) << s.count << std::fixed << std::setprecision(2) << std::setw(6)
            << s.min << "s" << std::setw(6) << s.avg << "s" << std::setw(6) << s.max << "s"
            << std::setw(7) << s.total << "s\n";
    }
}

} // namespace strata::listeners
