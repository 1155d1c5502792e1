//! # Relationship Resolver
//!
//! Turns a `RawRelationship` into one alternative of the closed
//! `RelationshipKind` variant, inferring every key that was left out.
//!
//! Resolution needs to see the whole document (relationships may point
//! forward), so it runs against a `SchemaIndex` built up front. Many-to-many
//! kinds do not pick their pivot keys themselves: they file a claim with the
//! shared `PivotRegistry` and receive the merged keys through
//! `apply_pivot_keys` once the registry is finalized.
//!
//! ## Derived Names
//!
//! | Kind | Derived |
//! |------|---------|
//! | `belongsTo` | `foreign_key = {target}_id`, `owner_key = target pk` |
//! | `hasOne` / `hasMany` | `foreign_key = {owner}_id`, `local_key = owner pk` |
//! | `belongsToMany` | pivot `join("_", sorted(tables))`, keys from the registry |
//! | `morphTo` | `{morph}_type`, `{morph}_id` |
//! | `morphOne` / `morphMany` | `local_key = owner pk` |
//! | `morphToMany` | pivot `pluralize(morph)`, keys from the registry |

#ifndef SCHEMLY_SCHEMA_RELATIONSHIP_RESOLVER_HPP
#define SCHEMLY_SCHEMA_RELATIONSHIP_RESOLVER_HPP

#include "common.hpp"
#include "schema/config.hpp"
#include "schema/error.hpp"
#include "schema/model.hpp"
#include "schema/pivot_registry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace schemly::schema {

// ============================================================================
// Schema Index
// ============================================================================

/// What relationship resolution needs to know about an entity before the
/// entity itself is resolved.
struct EntityInfo {
    std::string name;
    std::string table;
    std::string primary_key;
    /// Morph names of the entity's `morphTo` relationships.
    std::vector<std::string> morph_names;
    size_t position = 0;
};

/// Name lookup over the raw document. The first declaration of a name wins;
/// duplicates are reported by the validator.
class SchemaIndex {
public:
    explicit SchemaIndex(const RawSchema& schema);

    [[nodiscard]] auto find(std::string_view name) const -> const EntityInfo*;

    [[nodiscard]] auto declares_morph(std::string_view entity, std::string_view morph) const
        -> bool;

    [[nodiscard]] auto size() const -> size_t {
        return entities_.size();
    }

private:
    std::vector<EntityInfo> entities_;
    std::unordered_map<std::string, size_t> by_name_;
};

/// Storage name of an entity: explicit `table`, else `pluralize(snake_case(name))`.
[[nodiscard]] auto table_of(const RawEntity& entity) -> std::string;

/// Name of the field marked `primary`, else `id`.
[[nodiscard]] auto primary_key_of(const RawEntity& entity) -> std::string;

// ============================================================================
// Relationship Resolver
// ============================================================================

struct ResolvedRelationship {
    Relationship relationship;
    /// Set for `belongsToMany` and `morphToMany`.
    std::optional<ClaimId> claim;
};

class RelationshipResolver {
public:
    RelationshipResolver(const SchemaIndex& index, PivotRegistry& registry);

    /// Resolves the `index`-th relationship of `owner`. A pivot claim is
    /// filed as a side effect for many-to-many kinds.
    [[nodiscard]] auto resolve(const RawRelationship& raw, const RawEntity& owner, size_t index)
        -> Result<ResolvedRelationship, SchemaError>;

    /// Copies finalized pivot keys into a `belongsToMany` or `morphToMany`.
    static void apply_pivot_keys(Relationship& relationship, const PivotKeys& keys);

private:
    const SchemaIndex& index_;
    PivotRegistry& registry_;

    auto lookup_target(const RawRelationship& raw, const ErrorLocation& where)
        -> Result<const EntityInfo*, SchemaError>;
};

/// Location string used for a relationship in errors: its name, else
/// `kind target`.
[[nodiscard]] auto relationship_label(const RawRelationship& raw) -> std::string;

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_RELATIONSHIP_RESOLVER_HPP
