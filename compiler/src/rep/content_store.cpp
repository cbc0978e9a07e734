#include "rep/content_store.hpp"

namespace strata::rep {

void ContentStore::initialize(const item::Item& item) {
    if (item.is_binary()) {
        BinaryState state;
        state.set_last(item.raw_filename());
        state_ = std::move(state);
    } else {
        TextState state;
        state.set_last(make_content(item.raw_content()));
        state_ = std::move(state);
    }
}

void ContentStore::set_text(Content last) {
    if (auto* state = text()) {
        state->set_last(std::move(last));
        return;
    }
    TextState state;
    state.set_last(std::move(last));
    state_ = std::move(state);
}

void ContentStore::set_binary(std::filesystem::path last) {
    if (auto* state = binary()) {
        state->set_last(std::move(last));
        return;
    }
    BinaryState state;
    state.set_last(std::move(last));
    state_ = std::move(state);
}

} // namespace strata::rep
