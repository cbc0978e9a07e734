//! # Items and Layouts
//!
//! The source objects a representation is compiled from. Both are immutable
//! once constructed; the compilation core only reads them.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace strata::item {

/// Kind of object a `Reference` points at.
enum class ObjectKind : uint8_t {
    Item,
    Layout,
    ItemRep,
};

/// Returns "item", "layout" or "item_rep".
const char* object_kind_name(ObjectKind kind);

/// Identity of an item, layout or item representation, independent of its address.
struct Reference {
    ObjectKind kind = ObjectKind::Item;
    std::string identifier;
    std::string rep_name; ///< Only set for `ObjectKind::ItemRep`

    bool operator==(const Reference& other) const = default;

    /// e.g. `item /about/` or `item_rep /about/ (default)`.
    [[nodiscard]] std::string to_string() const;
};

struct ReferenceHash {
    size_t operator()(const Reference& ref) const {
        size_t h = std::hash<std::string>{}(ref.identifier);
        h ^= std::hash<std::string>{}(ref.rep_name) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h ^ static_cast<size_t>(ref.kind);
    }
};

/// A content item.
///
/// Textual items carry their raw content; binary items carry the path of the
/// file holding their data.
class Item {
public:
    static Item textual(std::string identifier, std::string raw_content);

    static Item binary(std::string identifier, std::filesystem::path raw_filename);

    const std::string& identifier() const {
        return identifier_;
    }

    bool is_binary() const {
        return binary_;
    }

    /// Raw content; empty for binary items.
    const std::string& raw_content() const {
        return raw_content_;
    }

    /// Path of the raw data; empty for textual items.
    const std::filesystem::path& raw_filename() const {
        return raw_filename_;
    }

    Reference reference() const {
        return {ObjectKind::Item, identifier_, {}};
    }

private:
    Item(std::string identifier, std::string raw_content, std::filesystem::path raw_filename,
         bool binary);

    std::string identifier_;
    std::string raw_content_;
    std::filesystem::path raw_filename_;
    bool binary_;
};

/// A layout: textual content that wraps a representation's content.
class Layout {
public:
    Layout(std::string identifier, std::string raw_content)
        : identifier_(std::move(identifier)), raw_content_(std::move(raw_content)) {}

    const std::string& identifier() const {
        return identifier_;
    }

    const std::string& raw_content() const {
        return raw_content_;
    }

    Reference reference() const {
        return {ObjectKind::Layout, identifier_, {}};
    }

private:
    std::string identifier_;
    std::string raw_content_;
};

} // namespace strata::item
