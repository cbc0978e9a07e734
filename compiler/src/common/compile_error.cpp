#include "common/compile_error.hpp"

#include <cstdio>

namespace strata {

auto CompileError::code_string() const -> std::string {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "S%03d", static_cast<int>(code) + 1);
    return buf;
}

auto CompileError::to_string() const -> std::string {
    return "error[" + code_string() + "]: " + message;
}

auto CompileError::unknown_filter(const std::string& filter_name) -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::UnknownFilter;
    err.message = "the requested filter, \"" + filter_name + "\", does not exist";
    err.filter_name = filter_name;
    return err;
}

auto CompileError::cannot_use_binary_filter(const std::string& rep, const std::string& filter_name)
    -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::CannotUseBinaryFilter;
    err.message = "the \"" + filter_name + "\" filter cannot be used to filter the " + rep +
                  ", because binary filters cannot be used on textual items";
    err.rep = rep;
    err.filter_name = filter_name;
    return err;
}

auto CompileError::cannot_use_textual_filter(const std::string& rep,
                                             const std::string& filter_name) -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::CannotUseTextualFilter;
    err.message = "the \"" + filter_name + "\" filter cannot be used to filter the " + rep +
                  ", because textual filters cannot be used on binary items";
    err.rep = rep;
    err.filter_name = filter_name;
    return err;
}

auto CompileError::cannot_layout_binary_item(const std::string& rep) -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::CannotLayoutBinaryItem;
    err.message = "the " + rep + " cannot be laid out because it is a binary item";
    err.rep = rep;
    return err;
}

auto CompileError::cannot_get_compiled_content_of_binary_item(const std::string& rep)
    -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::CannotGetCompiledContentOfBinaryItem;
    err.message = "you cannot access the compiled content of the binary " + rep;
    err.rep = rep;
    return err;
}

auto CompileError::no_such_snapshot(const std::string& rep, const std::string& snapshot)
    -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::NoSuchSnapshot;
    err.message = "the " + rep + " does not have a snapshot \"" + snapshot + "\"";
    err.rep = rep;
    err.snapshot = snapshot;
    return err;
}

auto CompileError::unmet_dependency(const std::string& rep, const std::string& snapshot)
    -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::UnmetDependency;
    err.message = "the " + rep + " has not yet produced snapshot \"" + snapshot + "\"";
    err.rep = rep;
    err.snapshot = snapshot;
    return err;
}

auto CompileError::output_not_written(const std::string& rep, const std::string& filter_name,
                                      const std::string& path) -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::OutputNotWritten;
    err.message = "the \"" + filter_name +
                  "\" filter did not write anything to the required output file, " + path;
    err.rep = rep;
    err.filter_name = filter_name;
    err.path = path;
    return err;
}

auto CompileError::filter_failed(const std::string& filter_name, const std::string& reason)
    -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::FilterFailed;
    err.message = "the \"" + filter_name + "\" filter failed: " + reason;
    err.filter_name = filter_name;
    return err;
}

auto CompileError::write_failed(const std::string& rep, const std::string& path,
                                const std::string& reason) -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::WriteFailed;
    err.message = "could not write " + path + " for the " + rep + ": " + reason;
    err.rep = rep;
    err.path = path;
    return err;
}

auto CompileError::dependency_cycle(const std::vector<std::string>& reps) -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::DependencyCycle;
    err.message = "the site cannot be compiled because these item representations depend on "
                  "each other:";
    for (const auto& rep : reps) {
        err.message += "\n  " + rep;
    }
    if (!reps.empty()) {
        err.rep = reps.front();
    }
    return err;
}

auto CompileError::invalid_state(const std::string& rep, const std::string& reason)
    -> CompileError {
    CompileError err;
    err.code = CompileErrorCode::InvalidState;
    err.message = "the " + rep + " is in an invalid state: " + reason;
    err.rep = rep;
    return err;
}

} // namespace strata
