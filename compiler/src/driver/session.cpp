#include "driver/session.hpp"

#include "log/log.hpp"

#include <utility>

namespace strata::driver {

Session::Session(config::CompileConfig config, const filter::FilterRegistry& filters,
                 std::ostream& out)
    : config_(std::move(config)), filters_(filters), out_(out), temp_files_(config_.tmp_dir) {
    dependencies_.start(notifications_);

    if (config_.log_file_actions) {
        file_actions_.emplace(out_);
        file_actions_->start(notifications_);
    }
    if (config_.profile_filters) {
        filter_timings_.emplace();
        filter_timings_->start(notifications_);
    }
}

Session::~Session() {
    if (filter_timings_) {
        filter_timings_->stop();
    }
    if (file_actions_) {
        file_actions_->stop();
    }
    dependencies_.stop();
}

rep::CompileContext Session::context() {
    return {filters_, notifications_, temp_files_};
}

Status Session::compile(const std::vector<CompileJob>& jobs) {
    RepCompiler compiler(notifications_);
    Status status = compiler.compile_all(jobs);

    if (file_actions_) {
        std::vector<const rep::ItemRep*> reps;
        reps.reserve(jobs.size());
        for (const auto& job : jobs) {
            reps.push_back(job.rep);
        }
        file_actions_->finish(reps);
    }
    if (filter_timings_) {
        filter_timings_->report(out_);
    }

    temp_files_.cleanup();
    STRATA_LOG_DEBUG("driver", "Removed temporary files under " << temp_files_.root().string());
    return status;
}

} // namespace strata::driver
