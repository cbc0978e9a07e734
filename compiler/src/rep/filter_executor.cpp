//! # Filter and Layout Execution
//!
//! `ItemRep::filter` and `ItemRep::layout`. Both resolve a filter from the
//! registry, check it against the representation's current mode, run it and
//! store the result as the new `last` content.

#include "log/log.hpp"
#include "rep/item_rep.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace strata::rep {

Status ItemRep::filter(const std::string& filter_name, const filter::FilterArgs& args) {
    const auto* descriptor = context_.filters.resolve(filter_name);
    if (!descriptor) {
        return CompileError::unknown_filter(filter_name);
    }

    if (descriptor->is_binary_input() && !binary()) {
        return CompileError::cannot_use_binary_filter(describe(), filter_name);
    }
    if (!descriptor->is_binary_input() && binary()) {
        return CompileError::cannot_use_textual_filter(describe(), filter_name);
    }

    event::ScopedNotification filtering(context_.notifications,
                                        notification(event::Event::FilteringStarted, filter_name),
                                        notification(event::Event::FilteringEnded, filter_name));

    STRATA_LOG_DEBUG("filter", "Running " << filter_name << " on " << describe());

    filter::FilterContext filter_context{assigns_, {}};
    if (descriptor->is_binary_output()) {
        filter_context.output_path = context_.temp_files.create("filter");
    }
    auto instance = descriptor->factory(std::move(filter_context));

    Content source = binary() ? make_content(store_.binary()->last().string())
                              : store_.text()->at(SNAPSHOT_LAST);

    auto result = instance->run(*source, args);
    if (is_err(result)) {
        auto& err = unwrap_err(result);
        if (err.rep.empty()) {
            err.rep = describe();
        }
        if (!err.is_unmet_dependency()) {
            STRATA_LOG_ERROR("filter", err.to_string());
        }
        return err;
    }

    if (descriptor->is_binary_output()) {
        store_.set_binary(instance->output_path());

        std::error_code ec;
        if (!fs::is_regular_file(instance->output_path(), ec)) {
            return CompileError::output_not_written(describe(), filter_name,
                                                    instance->output_path().string());
        }
        return true;
    }

    store_.set_text(make_content(std::move(unwrap(result))));
    return snapshot(store_.text()->contains(SNAPSHOT_POST) ? SNAPSHOT_POST : SNAPSHOT_PRE, false);
}

Status ItemRep::layout(const item::Layout& layout, const std::string& filter_name,
                       const filter::FilterArgs& args) {
    if (binary()) {
        return CompileError::cannot_layout_binary_item(describe());
    }

    if (!store_.text()->contains(SNAPSHOT_POST)) {
        auto sealed = snapshot(SNAPSHOT_PRE, true);
        if (is_err(sealed)) {
            return sealed;
        }
    }

    const auto* descriptor = context_.filters.resolve(filter_name);
    if (!descriptor) {
        return CompileError::unknown_filter(filter_name);
    }
    if (descriptor->is_binary_input() || descriptor->is_binary_output()) {
        return CompileError::cannot_use_binary_filter(describe(), filter_name);
    }

    filter::Assigns layout_assigns = assigns_;
    layout_assigns["layout"] = &layout;
    auto instance = descriptor->factory({std::move(layout_assigns), {}});

    context_.notifications.post_visit(layout.reference());

    auto processing_started = notification(event::Event::ProcessingStarted);
    processing_started.object = layout.reference();
    auto processing_ended = notification(event::Event::ProcessingEnded);
    processing_ended.object = layout.reference();

    // Declared in this order so filtering_ended fires before processing_ended
    event::ScopedNotification processing(context_.notifications, std::move(processing_started),
                                         std::move(processing_ended));
    event::ScopedNotification filtering(context_.notifications,
                                        notification(event::Event::FilteringStarted, filter_name),
                                        notification(event::Event::FilteringEnded, filter_name));

    STRATA_LOG_DEBUG("layout", "Laying out " << describe() << " with " << layout.identifier()
                                             << " using " << filter_name);

    auto result = instance->run(layout.raw_content(), args);
    if (is_err(result)) {
        auto& err = unwrap_err(result);
        if (err.rep.empty()) {
            err.rep = describe();
        }
        if (!err.is_unmet_dependency()) {
            STRATA_LOG_ERROR("layout", err.to_string());
        }
        return err;
    }

    store_.set_text(make_content(std::move(unwrap(result))));
    return snapshot(SNAPSHOT_POST, false);
}

} // namespace strata::rep
