#include "rep/item_rep.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <utility>

namespace strata::rep {

ItemRep::ItemRep(const item::Item& item, std::string name, CompileContext context)
    : item_(item), name_(std::move(name)), context_(context), store_(item) {}

// ============================================================================
// Snapshots
// ============================================================================

Status ItemRep::snapshot(const std::string& name, bool is_final) {
    if (auto* text = store_.text()) {
        text->content[name] = text->at(SNAPSHOT_LAST);
    } else if (auto* binary = store_.binary()) {
        if (name != SNAPSHOT_LAST) {
            binary->files[name] = binary->last();
        }
    }

    if (name == SNAPSHOT_PRE && is_final) {
        snapshots_.push_back({SNAPSHOT_PRE, true});
    }

    STRATA_LOG_TRACE("rep", "Snapshot " << name << (is_final ? " (final)" : "") << " of "
                                        << describe());

    if (!is_final) {
        return true;
    }
    auto written = write(name);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    return true;
}

auto ItemRep::compiled_content(const std::optional<std::string>& snapshot) const
    -> Result<std::string, CompileError> {
    const auto* text = store_.text();
    if (!text) {
        return CompileError::cannot_get_compiled_content_of_binary_item(describe());
    }

    context_.notifications.post_visit(item_.reference());

    std::string name = snapshot.value_or(text->contains(SNAPSHOT_PRE) ? SNAPSHOT_PRE
                                                                      : SNAPSHOT_LAST);
    bool is_moving = is_moving_snapshot(name);

    const SnapshotEntry* sealed = find_snapshot(name);
    if (!is_moving && (!sealed || !sealed->is_final)) {
        return CompileError::no_such_snapshot(describe(), name);
    }

    bool is_still_moving = true;
    if (name == SNAPSHOT_PRE) {
        is_still_moving = !sealed || !sealed->is_final;
    } else if (!is_moving) {
        is_still_moving = false;
    }

    Content content = text->at(name);
    if (!content || (!compiled_ && is_still_moving)) {
        STRATA_LOG_DEBUG("rep", "Snapshot " << name << " of " << describe() << " not available yet");
        return CompileError::unmet_dependency(describe(), name);
    }
    return *content;
}

auto ItemRep::write(const std::string& snapshot) -> Result<WriteResult, CompileError> {
    RepWriter writer(context_.notifications);
    return writer.write(*this, snapshot);
}

void ItemRep::forget_progress() {
    STRATA_LOG_DEBUG("rep", "Forgetting progress of " << describe());
    store_.initialize(item_);
}

bool ItemRep::has_snapshot(const std::string& name) const {
    if (const auto* text = store_.text()) {
        return text->contains(name);
    }
    return false;
}

void ItemRep::declare_snapshot(const std::string& name, bool is_final) {
    snapshots_.push_back({name, is_final});
}

const SnapshotEntry* ItemRep::find_snapshot(const std::string& name) const {
    auto it = std::find_if(snapshots_.begin(), snapshots_.end(),
                           [&](const SnapshotEntry& entry) { return entry.name == name; });
    return it == snapshots_.end() ? nullptr : &*it;
}

// ============================================================================
// Paths
// ============================================================================

std::optional<std::filesystem::path> ItemRep::raw_path(const std::string& snapshot) const {
    context_.notifications.post_visit(item_.reference());

    auto it = raw_paths_.find(snapshot);
    if (it == raw_paths_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ItemRep::path(const std::string& snapshot) const {
    context_.notifications.post_visit(item_.reference());

    auto it = paths_.find(snapshot);
    if (it == paths_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ItemRep::set_raw_path(const std::string& snapshot, std::filesystem::path raw_path) {
    raw_paths_[snapshot] = std::move(raw_path);
}

void ItemRep::set_path(const std::string& snapshot, std::string path) {
    paths_[snapshot] = std::move(path);
}

// ============================================================================
// Identity
// ============================================================================

std::string ItemRep::describe() const {
    std::string result = "item rep \"" + name_ + "\" of " + item_.identifier();
    result += binary() ? " (binary" : " (text";
    auto it = raw_paths_.find(SNAPSHOT_LAST);
    if (it != raw_paths_.end()) {
        result += ", raw_path=" + it->second.string();
    }
    result += ")";
    return result;
}

event::Notification ItemRep::notification(event::Event event,
                                          const std::string& filter_name) const {
    event::Notification n{event};
    n.rep = this;
    n.filter_name = filter_name;
    return n;
}

} // namespace strata::rep
