//! # Representation Compiler
//!
//! Runs compilation rules against representations and retries the ones that
//! were suspended on an unmet dependency.
//!
//! ## Retry Loop
//!
//! ```text
//! pass 1:  A ok   B suspended (needs C)   C ok
//! pass 2:  B ok
//! ```
//!
//! A pass in which no representation completes while some are still
//! suspended means they wait on each other; `compile_all` then fails with
//! `DependencyCycle`.

#pragma once

#include "common/compile_error.hpp"
#include "event/notification.hpp"
#include "rep/item_rep.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace strata::driver {

using rep::ItemRep;

/// Applies the filters, layouts and snapshots of one representation.
using Rule = std::function<Status(rep::ItemRep&)>;

enum class CompileStatus : uint8_t {
    Compiled,  ///< Rule ran to completion, output written
    Suspended, ///< Stopped on an unmet dependency; retry later
    Failed,    ///< Stopped on any other error
};

/// Returns "compiled", "suspended" or "failed".
const char* compile_status_name(CompileStatus status);

struct CompileOutcome {
    CompileStatus status = CompileStatus::Compiled;

    /// Set for `Suspended` and `Failed`.
    std::optional<CompileError> error;
};

/// A representation together with the rule that compiles it.
struct CompileJob {
    ItemRep* rep = nullptr;
    Rule rule;
};

class RepCompiler {
public:
    explicit RepCompiler(event::NotificationCenter& notifications)
        : notifications_(notifications) {}

    /// Runs one compilation attempt of `rep`. Already compiled representations
    /// are reported as `Compiled` without running the rule again.
    CompileOutcome compile(rep::ItemRep& rep, const Rule& rule);

    /// Compiles every job, retrying suspended ones until all are compiled.
    Status compile_all(const std::vector<CompileJob>& jobs);

    /// Number of passes the last `compile_all` needed.
    size_t passes() const {
        return passes_;
    }

private:
    event::NotificationCenter& notifications_;
    size_t passes_ = 0;
};

} // namespace strata::driver
