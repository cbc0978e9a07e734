//! # Compilation Notifications
//!
//! Lifecycle events posted while representations are compiled. Listeners
//! implement `NotificationSink` and are registered on a `NotificationCenter`,
//! which is passed explicitly to every component that posts events.
//!
//! ## Events
//!
//! | Event                   | Subject          | Extra fields                  |
//! |-------------------------|------------------|-------------------------------|
//! | `filtering_started`     | rep              | filter_name                   |
//! | `filtering_ended`       | rep              | filter_name                   |
//! | `processing_started`    | layout           |                               |
//! | `processing_ended`      | layout           |                               |
//! | `visit_started`         | item or layout   |                               |
//! | `visit_ended`           | item or layout   |                               |
//! | `will_write_rep`        | rep              | snapshot                      |
//! | `rep_written`           | rep              | path, is_created, is_modified |
//! | `compilation_started`   | rep              |                               |
//! | `compilation_ended`     | rep              |                               |
//! | `compilation_suspended` | rep              | message                       |
//! | `compilation_failed`    | rep              | message                       |

#pragma once

#include "item/item.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata::rep {
class ItemRep;
}

namespace strata::event {

using rep::ItemRep;

enum class Event : uint8_t {
    FilteringStarted,
    FilteringEnded,
    ProcessingStarted,
    ProcessingEnded,
    VisitStarted,
    VisitEnded,
    WillWriteRep,
    RepWritten,
    CompilationStarted,
    CompilationEnded,
    CompilationSuspended,
    CompilationFailed,
};

/// Returns the snake_case event name, e.g. "filtering_started".
const char* event_name(Event event);

/// One posted event. Fields not listed for an event in the table above are left empty.
struct Notification {
    Event event;

    /// Representation the event is about.
    const ItemRep* rep = nullptr;

    /// Visited item/layout, or the layout being processed.
    std::optional<item::Reference> object;

    std::string filter_name;
    std::string snapshot;
    std::filesystem::path path;
    bool is_created = false;
    bool is_modified = false;
    std::string message;
};

/// Receives notifications.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void notify(const Notification& notification) = 0;
};

/// Fans notifications out to registered sinks in registration order.
///
/// Sinks are not owned; a sink must be removed before it is destroyed.
/// Posting is serialized; a sink may post again from inside `notify`.
class NotificationCenter : public NotificationSink {
public:
    void add(NotificationSink& sink);

    void remove(NotificationSink& sink);

    [[nodiscard]] size_t sink_count() const;

    void notify(const Notification& notification) override;

    void post(Event event, const rep::ItemRep& rep);

    void post(Event event, const item::Reference& object);

    void post_filtering(Event event, const rep::ItemRep& rep, const std::string& filter_name);

    /// Posts a `visit_started` / `visit_ended` pair for `object`.
    void post_visit(const item::Reference& object);

private:
    mutable std::recursive_mutex mutex_;
    std::vector<NotificationSink*> sinks_;
};

/// Posts `started` on construction and `ended` on destruction, so the ended
/// event fires on every exit path. An exception thrown by a sink while the
/// ended event is delivered is logged and dropped.
class ScopedNotification {
public:
    ScopedNotification(NotificationSink& sink, Notification started, Notification ended);
    ~ScopedNotification();

    ScopedNotification(const ScopedNotification&) = delete;
    ScopedNotification& operator=(const ScopedNotification&) = delete;

private:
    NotificationSink& sink_;
    Notification ended_;
};

} // namespace strata::event
