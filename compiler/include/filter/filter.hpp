//! # Filter Registry
//!
//! Maps filter names to descriptors. A descriptor declares the kind of content
//! a filter consumes and produces, and a factory that builds a fresh filter
//! instance for each invocation.
//!
//! ## Content Kinds
//!
//! | from   | to     | `run` receives       | `run` produces                       |
//! |--------|--------|----------------------|--------------------------------------|
//! | Text   | Text   | content              | new content                          |
//! | Text   | Binary | content              | writes `output_path()`               |
//! | Binary | Text   | path of the input    | new content                          |
//! | Binary | Binary | path of the input    | writes `output_path()`               |
//!
//! For binary output the string returned by `run` is ignored.

#pragma once

#include "common.hpp"
#include "common/compile_error.hpp"
#include "item/item.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace strata::rep {
class ItemRep;
}

namespace strata::filter {

/// Kind of content a filter consumes or produces.
enum class ContentKind : uint8_t {
    Text,
    Binary,
};

/// Returns "text" or "binary".
const char* content_kind_name(ContentKind kind);

/// A value exposed to a filter by the rule layer.
using AssignValue = std::variant<std::string, int64_t, bool, const item::Item*,
                                 const item::Layout*, const rep::ItemRep*>;

/// Named values visible to one filter invocation. The layout executor adds
/// `layout` pointing at the layout being applied.
using Assigns = std::map<std::string, AssignValue>;

/// Filter arguments supplied by the caller of `filter` / `layout`.
using FilterArgs = std::map<std::string, std::string>;

/// What a filter instance is constructed with.
struct FilterContext {
    Assigns assigns;

    /// Where a binary-output filter must write its result. Empty for text output.
    std::filesystem::path output_path;
};

/// Base class for all filters.
class Filter {
public:
    explicit Filter(FilterContext context) : context_(std::move(context)) {}
    virtual ~Filter() = default;

    Filter(const Filter&) = delete;
    Filter& operator=(const Filter&) = delete;

    /// Runs the filter on `source`. See the table above for what `source` is.
    virtual auto run(const std::string& source, const FilterArgs& args)
        -> Result<std::string, CompileError> = 0;

    const Assigns& assigns() const {
        return context_.assigns;
    }

    const std::filesystem::path& output_path() const {
        return context_.output_path;
    }

    /// Looks up an assign of type T; nullptr when missing or of another type.
    template <typename T> const T* assign(const std::string& name) const {
        auto it = context_.assigns.find(name);
        if (it == context_.assigns.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

private:
    FilterContext context_;
};

/// Builds a filter instance for one invocation.
using FilterFactory = std::function<Box<Filter>(FilterContext)>;

/// Declared behavior of a named filter.
struct FilterDescriptor {
    std::string name;
    ContentKind from = ContentKind::Text;
    ContentKind to = ContentKind::Text;
    FilterFactory factory;

    bool is_binary_input() const {
        return from == ContentKind::Binary;
    }

    bool is_binary_output() const {
        return to == ContentKind::Binary;
    }
};

/// Registry mapping filter names to their descriptors.
class FilterRegistry {
public:
    /// Register a filter. A later registration under the same name replaces the earlier one.
    void register_filter(FilterDescriptor descriptor);

    /// Register a filter class constructible from a `FilterContext`.
    template <typename F>
    void register_filter(const std::string& name, ContentKind from = ContentKind::Text,
                         ContentKind to = ContentKind::Text) {
        register_filter(FilterDescriptor{name, from, to, [](FilterContext ctx) -> Box<Filter> {
                                             return make_box<F>(std::move(ctx));
                                         }});
    }

    /// Get the descriptor for a filter name. Returns nullptr if not registered.
    [[nodiscard]] const FilterDescriptor* resolve(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const {
        return resolve(name) != nullptr;
    }

    /// Registered names in sorted order.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const {
        return filters_.size();
    }

private:
    std::unordered_map<std::string, FilterDescriptor> filters_;
};

} // namespace strata::filter
