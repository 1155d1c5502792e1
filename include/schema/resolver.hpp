//! # Schema Resolver
//!
//! The entry point of the library. Runs every stage over one document:
//!
//! ```text
//! RawSchema
//!   -> options (defaults, environment)
//!   -> declared pivots
//!   -> per entity: fields, relationships (pivot claims)
//!   -> pivot finalization
//!   -> dependency graph and emission order
//!   -> validation
//!   -> ResolvedSchema
//! ```
//!
//! Field and relationship errors are recovered locally: the offending item
//! is dropped and resolution goes on, so one run reports as many problems
//! as possible. All errors are returned together in stage order; a schema
//! is only produced when there are none.
//!
//! ## Example
//!
//! ```cpp
//! schemly::schema::SchemaResolver resolver;
//! auto result = resolver.resolve_file("schema.yaml");
//! if (is_err(result)) {
//!     std::cerr << format_errors(unwrap_err(result));
//! }
//! ```

#ifndef SCHEMLY_SCHEMA_RESOLVER_HPP
#define SCHEMLY_SCHEMA_RESOLVER_HPP

#include "common.hpp"
#include "schema/config.hpp"
#include "schema/error.hpp"
#include "schema/model.hpp"

#include <string>
#include <string_view>

namespace schemly::schema {

struct ResolveSettings {
    /// Apply `SCHEMLY_*` environment overrides to the options.
    bool use_environment = true;
};

class SchemaResolver {
public:
    explicit SchemaResolver(ResolveSettings settings = {}) : settings_(settings) {}

    [[nodiscard]] auto resolve(const RawSchema& raw) -> Result<ResolvedSchema, ErrorList>;

    /// Loads and resolves a YAML or JSON document.
    [[nodiscard]] auto resolve_string(std::string_view text, std::string source_name = "<string>")
        -> Result<ResolvedSchema, ErrorList>;

    [[nodiscard]] auto resolve_file(const std::string& path) -> Result<ResolvedSchema, ErrorList>;

private:
    ResolveSettings settings_;
};

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_RESOLVER_HPP
