//! # Content Store
//!
//! Current and snapshotted content of one item representation. The store is
//! either textual or binary, never both:
//!
//! - `TextState` maps snapshot names to immutable content strings.
//! - `BinaryState` maps snapshot names to the files holding binary content.
//!
//! Both always hold an entry for `last` once initialized.

#pragma once

#include "item/item.hpp"
#include "rep/snapshot.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace strata::rep {

/// Immutable textual content. Replacing a snapshot installs a new value; the
/// previous one is never modified.
using Content = std::shared_ptr<const std::string>;

inline Content make_content(std::string text) {
    return std::make_shared<const std::string>(std::move(text));
}

/// Textual mode: snapshot name -> content.
struct TextState {
    std::map<std::string, Content> content;

    void set_last(Content value) {
        content[SNAPSHOT_LAST] = std::move(value);
    }

    /// Content stored under `name`, or nullptr.
    Content at(const std::string& name) const {
        auto it = content.find(name);
        return it == content.end() ? nullptr : it->second;
    }

    bool contains(const std::string& name) const {
        return content.count(name) > 0;
    }

    const std::string& last() const {
        return *content.at(SNAPSHOT_LAST);
    }
};

/// Binary mode: snapshot name -> file holding the content.
struct BinaryState {
    std::map<std::string, std::filesystem::path> files;

    void set_last(std::filesystem::path path) {
        files[SNAPSHOT_LAST] = std::move(path);
    }

    /// File stored under `name`, or nullptr.
    const std::filesystem::path* at(const std::string& name) const {
        auto it = files.find(name);
        return it == files.end() ? nullptr : &it->second;
    }

    const std::filesystem::path& last() const {
        return files.at(SNAPSHOT_LAST);
    }
};

class ContentStore {
public:
    explicit ContentStore(const item::Item& item) {
        initialize(item);
    }

    /// Resets to the item's raw content in the item's native mode.
    void initialize(const item::Item& item);

    [[nodiscard]] bool is_binary() const {
        return std::holds_alternative<BinaryState>(state_);
    }

    /// Active textual state, or nullptr in binary mode.
    TextState* text() {
        return std::get_if<TextState>(&state_);
    }

    const TextState* text() const {
        return std::get_if<TextState>(&state_);
    }

    /// Active binary state, or nullptr in textual mode.
    BinaryState* binary() {
        return std::get_if<BinaryState>(&state_);
    }

    const BinaryState* binary() const {
        return std::get_if<BinaryState>(&state_);
    }

    /// Switches to (or stays in) textual mode with `last` as the only entry
    /// when the mode changes, or replacing `last` otherwise.
    void set_text(Content last);

    /// Switches to (or stays in) binary mode, analogous to `set_text`.
    void set_binary(std::filesystem::path last);

private:
    std::variant<TextState, BinaryState> state_;
};

} // namespace strata::rep
