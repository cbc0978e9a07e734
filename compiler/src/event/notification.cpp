#include "event/notification.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace strata::event {

const char* event_name(Event event) {
    switch (event) {
    case Event::FilteringStarted:
        return "filtering_started";
    case Event::FilteringEnded:
        return "filtering_ended";
    case Event::ProcessingStarted:
        return "processing_started";
    case Event::ProcessingEnded:
        return "processing_ended";
    case Event::VisitStarted:
        return "visit_started";
    case Event::VisitEnded:
        return "visit_ended";
    case Event::WillWriteRep:
        return "will_write_rep";
    case Event::RepWritten:
        return "rep_written";
    case Event::CompilationStarted:
        return "compilation_started";
    case Event::CompilationEnded:
        return "compilation_ended";
    case Event::CompilationSuspended:
        return "compilation_suspended";
    case Event::CompilationFailed:
        return "compilation_failed";
    }
    return "unknown";
}

// ============================================================================
// NotificationCenter
// ============================================================================

void NotificationCenter::add(NotificationSink& sink) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), &sink) == sinks_.end()) {
        sinks_.push_back(&sink);
    }
}

void NotificationCenter::remove(NotificationSink& sink) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), &sink), sinks_.end());
}

size_t NotificationCenter::sink_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return sinks_.size();
}

void NotificationCenter::notify(const Notification& notification) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto sinks = sinks_;
    for (auto* sink : sinks) {
        sink->notify(notification);
    }
}

void NotificationCenter::post(Event event, const rep::ItemRep& rep) {
    Notification n{event};
    n.rep = &rep;
    notify(n);
}

void NotificationCenter::post(Event event, const item::Reference& object) {
    Notification n{event};
    n.object = object;
    notify(n);
}

void NotificationCenter::post_filtering(Event event, const rep::ItemRep& rep,
                                        const std::string& filter_name) {
    Notification n{event};
    n.rep = &rep;
    n.filter_name = filter_name;
    notify(n);
}

void NotificationCenter::post_visit(const item::Reference& object) {
    post(Event::VisitStarted, object);
    post(Event::VisitEnded, object);
}

// ============================================================================
// ScopedNotification
// ============================================================================

ScopedNotification::ScopedNotification(NotificationSink& sink, Notification started,
                                       Notification ended)
    : sink_(sink), ended_(std::move(ended)) {
    sink_.notify(started);
}

ScopedNotification::~ScopedNotification() {
    try {
        sink_.notify(ended_);
    } catch (const std::exception& e) {
        STRATA_LOG_ERROR("event", "Sink failed on " << event_name(ended_.event) << ": " << e.what());
    }
}

} // namespace strata::event
