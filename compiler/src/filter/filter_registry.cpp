#include "filter/filter.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace strata::filter {

const char* content_kind_name(ContentKind kind) {
    return kind == ContentKind::Binary ? "binary" : "text";
}

void FilterRegistry::register_filter(FilterDescriptor descriptor) {
    STRATA_LOG_TRACE("filter", "Registered filter " << descriptor.name << " ("
                                                    << content_kind_name(descriptor.from) << " -> "
                                                    << content_kind_name(descriptor.to) << ")");
    auto name = descriptor.name;
    filters_.insert_or_assign(std::move(name), std::move(descriptor));
}

const FilterDescriptor* FilterRegistry::resolve(const std::string& name) const {
    auto it = filters_.find(name);
    if (it == filters_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> FilterRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(filters_.size());
    for (const auto& [name, _] : filters_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace strata::filter
