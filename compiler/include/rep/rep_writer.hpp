//! # Representation Writer
//!
//! Flushes a snapshot of a representation to its raw path. Unchanged output is
//! left untouched, so its modification time only moves when the bytes change.
//!
//! | Output file        | Action      | is_created | is_modified |
//! |--------------------|-------------|------------|-------------|
//! | no raw path        | `Skipped`   | false      | false       |
//! | missing            | `Created`   | true       | true        |
//! | same bytes         | `Identical` | false      | false       |
//! | different bytes    | `Updated`   | false      | true        |

#pragma once

#include "common/compile_error.hpp"
#include "event/notification.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace strata::rep {

class ItemRep;

enum class WriteAction : uint8_t {
    Created,
    Updated,
    Identical,
    Skipped,
};

/// Returns "create", "update", "identical" or "skip".
const char* write_action_name(WriteAction action);

struct WriteResult {
    std::filesystem::path path;
    WriteAction action = WriteAction::Skipped;
    bool is_created = false;
    bool is_modified = false;
};

class RepWriter {
public:
    explicit RepWriter(event::NotificationSink& notifications) : notifications_(notifications) {}

    /// Writes `snapshot` of `rep`. Textual reps write their `last` content;
    /// binary reps copy the file recorded for `snapshot`, or for `last` when
    /// the snapshot has none.
    auto write(const ItemRep& rep, const std::string& snapshot) -> Result<WriteResult, CompileError>;

private:
    event::NotificationSink& notifications_;
};

/// Compares two files byte by byte. Missing or unreadable files are never equal.
bool files_identical(const std::filesystem::path& a, const std::filesystem::path& b);

/// True if the file at `path` holds exactly `content`.
bool file_has_content(const std::filesystem::path& path, const std::string& content);

} // namespace strata::rep
