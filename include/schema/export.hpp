//! # JSON Export
//!
//! Renders a `ResolvedSchema` or an error list as JSON for emitters and
//! tooling. Object keys are sorted and arrays keep emission order, so an
//! unchanged input always exports byte-identical text.
//!
//! ```json
//! {
//!   "emissionOrder": [{"kind": "entity", "name": "User"}, ...],
//!   "entities": [...],
//!   "options": {...},
//!   "pivots": [...],
//!   "version": "0.1.0"
//! }
//! ```

#ifndef SCHEMLY_SCHEMA_EXPORT_HPP
#define SCHEMLY_SCHEMA_EXPORT_HPP

#include "json/json_value.hpp"
#include "schema/error.hpp"
#include "schema/model.hpp"

namespace schemly::schema {

[[nodiscard]] auto to_json(const ResolvedSchema& schema) -> json::JsonValue;

[[nodiscard]] auto to_json(const Entity& entity) -> json::JsonValue;

[[nodiscard]] auto to_json(const Field& field) -> json::JsonValue;

[[nodiscard]] auto to_json(const Relationship& relationship) -> json::JsonValue;

[[nodiscard]] auto to_json(const Pivot& pivot) -> json::JsonValue;

/// `{"count": N, "errors": [{"code", "kind", "message", "location", "notes"}]}`
[[nodiscard]] auto errors_to_json(const ErrorList& errors) -> json::JsonValue;

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_EXPORT_HPP
