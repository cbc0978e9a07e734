#include "deps/dependency_tracker.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <thread>

namespace strata::deps {

DependencyTracker::~DependencyTracker() {
    stop();
}

void DependencyTracker::start(event::NotificationCenter& center) {
    stop();
    center.add(*this);
    std::lock_guard lock(mutex_);
    center_ = &center;
}

void DependencyTracker::stop() {
    event::NotificationCenter* center = nullptr;
    {
        std::lock_guard lock(mutex_);
        center = center_;
        center_ = nullptr;
    }
    if (center) {
        center->remove(*this);
    }
}

void DependencyTracker::notify(const event::Notification& notification) {
    if (!notification.object) {
        return;
    }
    if (notification.event == event::Event::VisitStarted) {
        push_active(*notification.object);
    } else if (notification.event == event::Event::VisitEnded) {
        pop_active();
    }
}

void DependencyTracker::push_active(const item::Reference& object) {
    std::lock_guard lock(mutex_);
    record_locked(object);
    active_stacks_[std::this_thread::get_id()].push_back(object);
}

void DependencyTracker::pop_active() {
    std::lock_guard lock(mutex_);
    auto it = active_stacks_.find(std::this_thread::get_id());
    if (it == active_stacks_.end()) {
        return;
    }
    it->second.pop_back();
    if (it->second.empty()) {
        active_stacks_.erase(it);
    }
}

void DependencyTracker::record_dependency(const item::Reference& object) {
    std::lock_guard lock(mutex_);
    record_locked(object);
}

const std::vector<item::Reference>* DependencyTracker::current_stack_locked() const {
    auto it = active_stacks_.find(std::this_thread::get_id());
    return it == active_stacks_.end() ? nullptr : &it->second;
}

void DependencyTracker::record_locked(const item::Reference& object) {
    const auto* stack = current_stack_locked();
    if (!stack || stack->back() == object) {
        return;
    }

    auto& deps = predecessors_[stack->back()];
    if (std::find(deps.begin(), deps.end(), object) == deps.end()) {
        STRATA_LOG_TRACE("deps", stack->back().to_string() << " depends on "
                                                           << object.to_string());
        deps.push_back(object);
    }
}

std::vector<item::Reference>
DependencyTracker::objects_causing_outdatedness_of(const item::Reference& object) const {
    std::lock_guard lock(mutex_);
    auto it = predecessors_.find(object);
    if (it == predecessors_.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::vector<item::Reference>>
DependencyTracker::detect_cycle(const item::Reference& object) const {
    std::lock_guard lock(mutex_);
    const auto* stack = current_stack_locked();
    if (!stack) {
        return std::nullopt;
    }

    for (size_t i = 0; i < stack->size(); ++i) {
        if ((*stack)[i] == object) {
            std::vector<item::Reference> cycle(stack->begin() + static_cast<long>(i),
                                               stack->end());
            cycle.push_back(object);
            return cycle;
        }
    }
    return std::nullopt;
}

size_t DependencyTracker::depth() const {
    std::lock_guard lock(mutex_);
    const auto* stack = current_stack_locked();
    return stack ? stack->size() : 0;
}

void DependencyTracker::clear() {
    std::lock_guard lock(mutex_);
    active_stacks_.clear();
    predecessors_.clear();
}

} // namespace strata::deps
