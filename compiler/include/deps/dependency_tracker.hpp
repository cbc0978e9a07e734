//! # Dependency Tracking
//!
//! Builds the dependency graph between items and layouts from visit
//! notifications. While an object is being visited (between its
//! `visit_started` and `visit_ended`), every other object visited is recorded
//! as one of its dependencies.
//!
//! ```text
//! visit_started(item A)          stack: [A]
//!   visit_started(item B)        A depends on B, stack: [A, B]
//!   visit_ended(item B)          stack: [A]
//!   visit_started(layout L)      A depends on L
//!   visit_ended(layout L)
//! visit_ended(item A)            stack: []
//! ```
//!
//! Each thread has its own visit stack, so representations compiled on
//! different threads record their dependencies independently.

#pragma once

#include "event/notification.hpp"
#include "item/item.hpp"

#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace strata::deps {

/// Records dependencies between items and layouts and detects cycles.
class DependencyTracker : public event::NotificationSink {
public:
    ~DependencyTracker() override;

    /// Starts listening for visit notifications on `center`.
    void start(event::NotificationCenter& center);

    /// Stops listening. Recorded dependencies are kept.
    void stop();

    void notify(const event::Notification& notification) override;

    /// Push an object onto the visit stack, recording it as a dependency of
    /// the object currently on top.
    void push_active(const item::Reference& object);

    /// Pop the object on top of the visit stack.
    void pop_active();

    /// Record that the object on top of the visit stack depends on `object`.
    void record_dependency(const item::Reference& object);

    /// Objects `object` depends on, in the order they were first visited.
    [[nodiscard]] std::vector<item::Reference>
    objects_causing_outdatedness_of(const item::Reference& object) const;

    /// Check if visiting `object` now would revisit an object already on the
    /// stack. Returns the cycle path if detected, or nullopt otherwise.
    [[nodiscard]] std::optional<std::vector<item::Reference>>
    detect_cycle(const item::Reference& object) const;

    /// Returns the visit stack depth of the calling thread.
    [[nodiscard]] size_t depth() const;

    /// Clear the visit stacks of all threads and all recorded dependencies.
    void clear();

private:
    mutable std::mutex mutex_;
    event::NotificationCenter* center_ = nullptr;
    std::unordered_map<std::thread::id, std::vector<item::Reference>> active_stacks_;
    std::unordered_map<item::Reference, std::vector<item::Reference>, item::ReferenceHash>
        predecessors_;

    const std::vector<item::Reference>* current_stack_locked() const;
    void record_locked(const item::Reference& object);
};

} // namespace strata::deps
