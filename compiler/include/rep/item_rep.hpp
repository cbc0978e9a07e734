//! # Item Representations
//!
//! One compiled output variant of an item. A representation runs the item's
//! content through filters and layouts, records snapshots along the way and
//! writes sealed snapshots to their output paths.
//!
//! ## Lifecycle
//!
//! ```text
//! ItemRep(item, name)          content[last] = raw content (or raw file)
//!   filter(name, args)         content[last] = filter output; pre/post moved
//!   layout(layout, filter)     seals pre, content[last] = laid out; post moved
//!   snapshot(name)             content[name] = content[last]; written if final
//!   forget_progress()          back to the item's raw content
//! ```
//!
//! Other representations read this one through `compiled_content()`. While
//! the requested snapshot is still moving and this representation has not been
//! fully compiled, the read fails with `UnmetDependency` and the caller is
//! expected to retry later.
//!
//! A representation is not thread-safe. Different representations may be
//! compiled on different threads.

#pragma once

#include "common/compile_error.hpp"
#include "event/notification.hpp"
#include "filter/filter.hpp"
#include "item/item.hpp"
#include "rep/content_store.hpp"
#include "rep/rep_writer.hpp"
#include "rep/snapshot.hpp"
#include "rep/temp_filenames.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata::rep {

using filter::Assigns;
using filter::FilterArgs;
using item::Item;
using item::Layout;

/// Collaborators shared by every representation of one compilation.
struct CompileContext {
    const filter::FilterRegistry& filters;
    event::NotificationCenter& notifications;
    TempFilenameFactory& temp_files;
};

class ItemRep {
public:
    ItemRep(const Item& item, std::string name, CompileContext context);

    ItemRep(const ItemRep&) = delete;
    ItemRep& operator=(const ItemRep&) = delete;

    // ========================================================================
    // Compilation
    // ========================================================================

    /// Runs the current content through the named filter.
    ///
    /// `filtering_started` / `filtering_ended` are posted around the run, also
    /// when the filter fails.
    Status filter(const std::string& filter_name, const FilterArgs& args = {});

    /// Lays out the current content with `layout`, using the named filter to
    /// process the layout's raw content. Seals `pre` unless a `post` snapshot
    /// already exists.
    Status layout(const Layout& layout, const std::string& filter_name,
                  const FilterArgs& args = {});

    /// Copies the current content to snapshot `name`. A final snapshot is
    /// written to its raw path right away.
    Status snapshot(const std::string& name, bool is_final = true);

    /// Compiled content at `snapshot`, defaulting to `pre` when present and
    /// `last` otherwise. Records a visit of the item.
    auto compiled_content(const std::optional<std::string>& snapshot = std::nullopt) const
        -> Result<std::string, CompileError>;

    /// Writes `snapshot` to its raw path. Does nothing without a raw path.
    auto write(const std::string& snapshot = SNAPSHOT_LAST) -> Result<WriteResult, CompileError>;

    /// Drops all compiled content and returns to the item's raw content.
    /// Sealed snapshots, paths and identity are kept.
    void forget_progress();

    /// True if content exists for `name`.
    bool has_snapshot(const std::string& name) const;

    // ========================================================================
    // Paths
    // ========================================================================

    /// Output file for `snapshot`, including the output directory. Records a
    /// visit of the item, also when no path is set.
    std::optional<std::filesystem::path> raw_path(const std::string& snapshot = SNAPSHOT_LAST) const;

    /// Public path for `snapshot`, relative to the output directory. Records
    /// a visit of the item, also when no path is set.
    std::optional<std::string> path(const std::string& snapshot = SNAPSHOT_LAST) const;

    void set_raw_path(const std::string& snapshot, std::filesystem::path raw_path);

    void set_path(const std::string& snapshot, std::string path);

    /// All raw paths, without recording a visit.
    const std::map<std::string, std::filesystem::path>& raw_paths() const {
        return raw_paths_;
    }

    const std::map<std::string, std::string>& paths() const {
        return paths_;
    }

    // ========================================================================
    // State
    // ========================================================================

    const Item& item() const {
        return item_;
    }

    const std::string& name() const {
        return name_;
    }

    /// Current mode; may differ from the item's once a filter converted it.
    bool binary() const {
        return store_.is_binary();
    }

    bool compiled() const {
        return compiled_;
    }

    void set_compiled(bool compiled) {
        compiled_ = compiled;
    }

    const Assigns& assigns() const {
        return assigns_;
    }

    /// Replaces the assigns seen by the next filter or layout.
    void set_assigns(Assigns assigns) {
        assigns_ = std::move(assigns);
    }

    /// Sealed-snapshot sequence.
    const std::vector<SnapshotEntry>& snapshots() const {
        return snapshots_;
    }

    /// Declares a snapshot the rule for this representation will create.
    void declare_snapshot(const std::string& name, bool is_final = true);

    const ContentStore& store() const {
        return store_;
    }

    ContentStore& store() {
        return store_;
    }

    // ========================================================================
    // Identity
    // ========================================================================

    item::Reference reference() const {
        return {item::ObjectKind::ItemRep, item_.identifier(), name_};
    }

    /// One-line description for logs and errors.
    std::string describe() const;

private:
    const SnapshotEntry* find_snapshot(const std::string& name) const;

    event::Notification notification(event::Event event,
                                     const std::string& filter_name = {}) const;

    const Item& item_;
    std::string name_;
    CompileContext context_;

    ContentStore store_;
    std::vector<SnapshotEntry> snapshots_;
    std::map<std::string, std::filesystem::path> raw_paths_;
    std::map<std::string, std::string> paths_;
    Assigns assigns_;
    bool compiled_ = false;
};

} // namespace strata::rep
