//! # Field Type Resolver
//!
//! Turns a `RawField` into a `Field`: classifies the type, applies
//! defaults and checks type-specific constraints. Independent problems in
//! one field are all reported.
//!
//! | Check | Error |
//! |-------|-------|
//! | type spelling not in the closed set | `UnknownFieldType` |
//! | decimal without precision | `MissingDecimalPrecision` |
//! | precision outside 1..65, scale outside 0..precision | `InvalidDecimalPrecision` |
//! | enum without values | `MissingEnumValues` |
//! | repeated / empty enum value | `DuplicateEnumValue` / `EmptyEnumValue` |
//! | `length: 0` on a string | `InvalidFieldLength` |
//! | auto-increment on a non-integer | `InvalidAutoIncrement` |
//! | primary and nullable | `NullablePrimaryKey` |
//! | default incompatible with the type | `InvalidDefaultValue` |

#ifndef SCHEMLY_SCHEMA_FIELD_RESOLVER_HPP
#define SCHEMLY_SCHEMA_FIELD_RESOLVER_HPP

#include "common.hpp"
#include "schema/config.hpp"
#include "schema/error.hpp"
#include "schema/model.hpp"

#include <string_view>

namespace schemly::schema {

/// Resolves one field. `owner` (entity or pivot name) only appears in error
/// locations.
[[nodiscard]] auto resolve_field(const RawField& raw, std::string_view owner)
    -> Result<Field, ErrorList>;

/// True if `value` is an acceptable default for `field`.
[[nodiscard]] auto is_compatible_default(const Field& field, std::string_view value) -> bool;

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_FIELD_RESOLVER_HPP
