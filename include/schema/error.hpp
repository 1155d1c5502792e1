//! # Schema Errors
//!
//! Every problem found while resolving a schema is a `SchemaError` value.
//! Stages accumulate errors into an `ErrorList` instead of stopping at the
//! first one, so a single run reports everything that is wrong.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category     | Example                          |
//! |--------|--------------|----------------------------------|
//! | M      | Input        | M001 - Malformed input           |
//! | F      | Field        | F002 - Missing decimal precision |
//! | R      | Relationship | R001 - Unknown target entity     |
//! | G      | Graph        | G001 - Cyclic dependency         |
//! | V      | Validation   | V002 - Duplicate table name      |
//!
//! Codes are stable: new kinds get new numbers, existing numbers never move.

#ifndef SCHEMLY_SCHEMA_ERROR_HPP
#define SCHEMLY_SCHEMA_ERROR_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemly::schema {

// ============================================================================
// Error Kinds
// ============================================================================

/// Closed set of error kinds.
enum class ErrorKind {
    // Input (M)
    MalformedInput,
    InvalidOption,

    // Field (F)
    UnknownFieldType,
    MissingDecimalPrecision,
    InvalidDecimalPrecision,
    MissingEnumValues,
    DuplicateEnumValue,
    EmptyEnumValue,
    InvalidFieldLength,
    InvalidAutoIncrement,
    NullablePrimaryKey,
    InvalidDefaultValue,

    // Relationship (R)
    UnknownTargetEntity,
    UnknownRelationshipKind,
    PivotKeyConflict,
    UnmatchedMorphName,
    CascadePolicyConflict,

    // Graph (G)
    CyclicDependency,

    // Validation (V)
    DuplicateEntityName,
    DuplicateTableName,
    DuplicateFieldName,
    EmptyEntity,
    InvalidIdentifier,
    ReservedIdentifier,
    ManualPrimaryKey,
};

/// Coarse grouping of error kinds, one per error code prefix.
enum class ErrorCategory {
    Input,
    Field,
    Relationship,
    Graph,
    Validation,
};

[[nodiscard]] auto error_category(ErrorKind kind) -> ErrorCategory;

/// Stable code such as `F002`.
[[nodiscard]] auto error_code(ErrorKind kind) -> const char*;

/// Kind name as written in reports, e.g. `MissingDecimalPrecision`.
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;

// ============================================================================
// SchemaError
// ============================================================================

/// Where an error was found. Every part is optional.
struct ErrorLocation {
    std::string entity;
    std::string field;
    std::string relationship;
    std::string pivot;
    SourceMark mark;

    [[nodiscard]] auto empty() const -> bool {
        return entity.empty() && field.empty() && relationship.empty() && pivot.empty() &&
               !mark.is_known();
    }

    /// `entity `Post`, field `price` (line 12, column 9)`
    [[nodiscard]] auto describe() const -> std::string;
};

struct SchemaError {
    ErrorKind kind;
    std::string message;
    ErrorLocation location;
    std::vector<std::string> notes;

    [[nodiscard]] auto code() const -> const char* {
        return error_code(kind);
    }

    [[nodiscard]] auto category() const -> ErrorCategory {
        return error_category(kind);
    }

    /// One report entry: header line, location line and notes.
    [[nodiscard]] auto to_string() const -> std::string;
};

using ErrorList = std::vector<SchemaError>;

/// Builds an error without notes.
[[nodiscard]] auto make_error(ErrorKind kind, std::string message, ErrorLocation location = {})
    -> SchemaError;

/// Appends every error of `from` to `into`.
void append_errors(ErrorList& into, ErrorList from);

/// True if any error in `errors` has the given kind.
[[nodiscard]] auto has_error(const ErrorList& errors, ErrorKind kind) -> bool;

/// Number of errors in `errors` with the given kind.
[[nodiscard]] auto count_errors(const ErrorList& errors, ErrorKind kind) -> size_t;

/// Renders an exhaustive report, one entry per error, followed by a summary
/// line (`3 errors`).
[[nodiscard]] auto format_errors(const ErrorList& errors) -> std::string;

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_ERROR_HPP
