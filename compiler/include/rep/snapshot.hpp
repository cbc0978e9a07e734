//! # Snapshot Names
//!
//! `pre`, `post` and `last` are moving snapshots: filters and layouts keep
//! overwriting them while a representation compiles. Every other name is
//! fixed and only exists once it has been sealed with `snapshot(name)`.

#pragma once

#include <string>

namespace strata::rep {

/// Content before any layout is applied.
inline constexpr const char* SNAPSHOT_PRE = "pre";

/// Content after the most recent layout.
inline constexpr const char* SNAPSHOT_POST = "post";

/// Most recently produced content.
inline constexpr const char* SNAPSHOT_LAST = "last";

/// One entry of a representation's sealed-snapshot sequence.
struct SnapshotEntry {
    std::string name;
    bool is_final = true;

    bool operator==(const SnapshotEntry& other) const = default;
};

/// True for `pre`, `post` and `last`.
inline bool is_moving_snapshot(const std::string& name) {
    return name == SNAPSHOT_PRE || name == SNAPSHOT_POST || name == SNAPSHOT_LAST;
}

} // namespace strata::rep
