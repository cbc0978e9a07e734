//! # Compile Errors
//!
//! Every failure the compilation core reports is a `CompileError`. Errors are
//! returned through `Result<T, CompileError>`, never thrown.
//!
//! ## Error Codes
//!
//! | Code | Kind                                 | Recoverable |
//! |------|--------------------------------------|-------------|
//! | S001 | UnknownFilter                        | no          |
//! | S002 | CannotUseBinaryFilter                | no          |
//! | S003 | CannotUseTextualFilter               | no          |
//! | S004 | CannotLayoutBinaryItem               | no          |
//! | S005 | CannotGetCompiledContentOfBinaryItem | no          |
//! | S006 | NoSuchSnapshot                       | no          |
//! | S007 | UnmetDependency                      | yes         |
//! | S008 | OutputNotWritten                     | no          |
//! | S009 | FilterFailed                         | no          |
//! | S010 | WriteFailed                          | no          |
//! | S011 | DependencyCycle                      | no          |
//! | S012 | InvalidState                         | no          |
//!
//! `UnmetDependency` is the only kind a driver is expected to catch: it means
//! another representation has not produced the requested content yet.

#pragma once

#include "common.hpp"

#include <string>
#include <vector>

namespace strata {

/// Error kinds reported by the compilation core.
enum class CompileErrorCode {
    UnknownFilter,                        ///< S001: Filter name does not resolve
    CannotUseBinaryFilter,                ///< S002: Binary-input filter on textual rep
    CannotUseTextualFilter,               ///< S003: Textual-input filter on binary rep
    CannotLayoutBinaryItem,               ///< S004: Layout on binary rep
    CannotGetCompiledContentOfBinaryItem, ///< S005: Content read on binary rep
    NoSuchSnapshot,                       ///< S006: Fixed snapshot never sealed
    UnmetDependency,                      ///< S007: Content not available yet
    OutputNotWritten,                     ///< S008: Binary filter wrote no output file
    FilterFailed,                         ///< S009: Filter reported a failure
    WriteFailed,                          ///< S010: Filesystem error while writing
    DependencyCycle,                      ///< S011: Reps wait on each other forever
    InvalidState,                         ///< S012: Representation state inconsistent
};

/// A compilation failure with the context needed to report it.
struct CompileError {
    CompileErrorCode code = CompileErrorCode::InvalidState;

    /// Human-readable description.
    std::string message;

    /// Description of the representation involved (see `ItemRep::describe()`).
    std::string rep;

    /// Filter involved, if any.
    std::string filter_name;

    /// Snapshot involved, if any.
    std::string snapshot;

    /// File involved, if any.
    std::string path;

    /// True only for `UnmetDependency`.
    [[nodiscard]] auto is_unmet_dependency() const -> bool {
        return code == CompileErrorCode::UnmetDependency;
    }

    /// Stable short code, e.g. "S007".
    [[nodiscard]] auto code_string() const -> std::string;

    /// `error[S00x]: message`.
    [[nodiscard]] auto to_string() const -> std::string;

    static auto unknown_filter(const std::string& filter_name) -> CompileError;

    static auto cannot_use_binary_filter(const std::string& rep, const std::string& filter_name)
        -> CompileError;

    static auto cannot_use_textual_filter(const std::string& rep, const std::string& filter_name)
        -> CompileError;

    static auto cannot_layout_binary_item(const std::string& rep) -> CompileError;

    static auto cannot_get_compiled_content_of_binary_item(const std::string& rep) -> CompileError;

    static auto no_such_snapshot(const std::string& rep, const std::string& snapshot)
        -> CompileError;

    static auto unmet_dependency(const std::string& rep, const std::string& snapshot)
        -> CompileError;

    static auto output_not_written(const std::string& rep, const std::string& filter_name,
                                   const std::string& path) -> CompileError;

    static auto filter_failed(const std::string& filter_name, const std::string& reason)
        -> CompileError;

    static auto write_failed(const std::string& rep, const std::string& path,
                             const std::string& reason) -> CompileError;

    static auto dependency_cycle(const std::vector<std::string>& reps) -> CompileError;

    static auto invalid_state(const std::string& rep, const std::string& reason) -> CompileError;
};

/// Result of an operation that only succeeds or fails.
using Status = Result<bool, CompileError>;

} // namespace strata
