#include "item/item.hpp"

namespace strata::item {

const char* object_kind_name(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Item:
        return "item";
    case ObjectKind::Layout:
        return "layout";
    case ObjectKind::ItemRep:
        return "item_rep";
    }
    return "object";
}

std::string Reference::to_string() const {
    std::string result = std::string(object_kind_name(kind)) + " " + identifier;
    if (kind == ObjectKind::ItemRep) {
        result += " (" + rep_name + ")";
    }
    return result;
}

Item::Item(std::string identifier, std::string raw_content, std::filesystem::path raw_filename,
           bool binary)
    : identifier_(std::move(identifier)), raw_content_(std::move(raw_content)),
      raw_filename_(std::move(raw_filename)), binary_(binary) {}

Item Item::textual(std::string identifier, std::string raw_content) {
    return Item(std::move(identifier), std::move(raw_content), {}, false);
}

Item Item::binary(std::string identifier, std::filesystem::path raw_filename) {
    return Item(std::move(identifier), {}, std::move(raw_filename), true);
}

} // namespace strata::item
