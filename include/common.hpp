//! # Common Definitions
//!
//! This module provides common types and utilities used throughout the
//! schemly resolver. Every other component depends on it.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Resolver version constants
//! - **Source Marks**: Line/column positions inside the input document
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Alias for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Errors cross module boundaries as `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership
//! - **Values over state**: Every resolution builds fresh values

#ifndef SCHEMLY_COMMON_HPP
#define SCHEMLY_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace schemly {

// ============================================================================
// Version Information
// ============================================================================

/// The resolver version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 1;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Marks
// ============================================================================

/// A position inside the input document.
///
/// Marks are produced by the document loader and carried on raw declarations
/// so errors can point back at the offending line. A default-constructed mark
/// means "position unknown" (e.g. for programmatically built schemas).
struct SourceMark {
    /// Line number (1-based, 0 = unknown).
    uint32_t line = 0;

    /// Column number (1-based, 0 = unknown).
    uint32_t column = 0;

    [[nodiscard]] auto is_known() const -> bool {
        return line != 0;
    }

    [[nodiscard]] auto operator==(const SourceMark& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// Result<Field, ErrorList> resolved = resolve_field(raw, "User");
/// if (is_ok(resolved)) {
///     const Field& field = unwrap(resolved);
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
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
///
/// `Box<T>` represents unique ownership of a heap-allocated value.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace schemly

#endif // SCHEMLY_COMMON_HPP
