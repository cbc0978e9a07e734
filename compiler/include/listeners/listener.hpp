//! # Compilation Listeners
//!
//! Listeners observe a compilation through its notifications and report on
//! it. They attach to a `NotificationCenter` with `start()` and detach with
//! `stop()` (also done on destruction).
//!
//! | Listener               | Reacts to                             | Output            |
//! |------------------------|---------------------------------------|-------------------|
//! | `FileActionLogger`     | compilation_started, rep_written      | one line per file |
//! | `FilterTimingRecorder` | filtering_started, filtering_ended    | timing table      |

#pragma once

#include "event/notification.hpp"

namespace strata::listeners {

class Listener : public event::NotificationSink {
public:
    ~Listener() override {
        stop();
    }

    void start(event::NotificationCenter& center) {
        stop();
        center.add(*this);
        center_ = &center;
    }

    void stop() {
        if (center_) {
            center_->remove(*this);
            center_ = nullptr;
        }
    }

    bool is_started() const {
        return center_ != nullptr;
    }

private:
    event::NotificationCenter* center_ = nullptr;
};

} // namespace strata::listeners
