//! # Common Definitions
//!
//! Types and helpers shared by every strata component.
//!
//! ## Overview
//!
//! - **Version Information**: library version constants
//! - **Result Type**: error handling without exceptions
//! - **Smart Pointers**: `Box<T>` for uniquely owned objects
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership
//! - **Immutable Content**: compiled content is never mutated in place

#ifndef STRATA_COMMON_HPP
#define STRATA_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace strata {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// Operations that only report success or failure return `Result<bool, E>`
/// and yield `true` on success.
///
/// # Example
///
/// ```cpp
/// auto result = rep.compiled_content("pre");
/// if (is_err(result) && unwrap_err(result).is_unmet_dependency()) {
///     // retry later
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace strata

#endif // STRATA_COMMON_HPP
