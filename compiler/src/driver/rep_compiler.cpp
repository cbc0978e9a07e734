#include "driver/rep_compiler.hpp"

#include "log/log.hpp"

#include <string>
#include <utility>

namespace strata::driver {

const char* compile_status_name(CompileStatus status) {
    switch (status) {
    case CompileStatus::Compiled:
        return "compiled";
    case CompileStatus::Suspended:
        return "suspended";
    case CompileStatus::Failed:
        return "failed";
    }
    return "unknown";
}

namespace {

event::Notification rep_notification(event::Event event, const rep::ItemRep& rep,
                                      const std::string& message = {}) {
    event::Notification n{event};
    n.rep = &rep;
    n.message = message;
    return n;
}

/// Seals the snapshots every rule ends with.
Status finish_rule(rep::ItemRep& rep) {
    if (rep.has_snapshot(rep::SNAPSHOT_POST)) {
        auto post = rep.snapshot(rep::SNAPSHOT_POST);
        if (is_err(post)) {
            return post;
        }
    }
    return rep.snapshot(rep::SNAPSHOT_LAST);
}

} // namespace

CompileOutcome RepCompiler::compile(rep::ItemRep& rep, const Rule& rule) {
    if (rep.compiled()) {
        return {};
    }

    notifications_.notify(rep_notification(event::Event::CompilationStarted, rep));
    STRATA_LOG_DEBUG("driver", "Compiling " << rep.describe());

    Status status = true;
    {
        // Everything the rule reads becomes a dependency of this item
        event::Notification visit_started{event::Event::VisitStarted};
        visit_started.object = rep.item().reference();
        event::Notification visit_ended{event::Event::VisitEnded};
        visit_ended.object = rep.item().reference();
        event::ScopedNotification visit(notifications_, std::move(visit_started),
                                        std::move(visit_ended));

        status = rule(rep);
        if (is_ok(status)) {
            status = finish_rule(rep);
        }
    }

    if (is_ok(status)) {
        rep.set_compiled(true);
        notifications_.notify(rep_notification(event::Event::CompilationEnded, rep));
        return {};
    }

    const CompileError& err = unwrap_err(status);
    if (err.is_unmet_dependency()) {
        STRATA_LOG_DEBUG("driver", "Suspended " << rep.describe() << ": " << err.message);
        rep.forget_progress();
        notifications_.notify(
            rep_notification(event::Event::CompilationSuspended, rep, err.message));
        return {CompileStatus::Suspended, err};
    }

    STRATA_LOG_ERROR("driver", "Failed to compile " << rep.describe() << ": " << err.to_string());
    notifications_.notify(rep_notification(event::Event::CompilationFailed, rep, err.message));
    return {CompileStatus::Failed, err};
}

Status RepCompiler::compile_all(const std::vector<CompileJob>& jobs) {
    passes_ = 0;

    while (true) {
        ++passes_;
        bool progress = false;
        std::vector<std::string> stalled;

        for (const auto& job : jobs) {
            if (job.rep->compiled()) {
                continue;
            }

            auto outcome = compile(*job.rep, job.rule);
            switch (outcome.status) {
            case CompileStatus::Compiled:
                progress = true;
                break;
            case CompileStatus::Suspended:
                stalled.push_back(job.rep->describe());
                break;
            case CompileStatus::Failed:
                return *outcome.error;
            }
        }

        if (stalled.empty()) {
            STRATA_LOG_INFO("driver", "Compiled " << jobs.size() << " representation(s) in "
                                                  << passes_ << " pass(es)");
            return true;
        }
        if (!progress) {
            auto err = CompileError::dependency_cycle(stalled);
            STRATA_LOG_ERROR("driver", err.to_string());
            return err;
        }
        STRATA_LOG_DEBUG("driver", "Pass " << passes_ << " left " << stalled.size()
                                           << " representation(s) suspended");
    }
}

} // namespace strata::driver
