//! # Schema Validator
//!
//! Whole-schema checks that no single entity can make on its own. Runs after
//! fields, relationships and pivots are resolved and reports every problem
//! it finds.
//!
//! | Check | Error |
//! |-------|-------|
//! | two entities with one name | `DuplicateEntityName` |
//! | a table name used twice (entities and pivots) | `DuplicateTableName` |
//! | a column name used twice in an entity or pivot | `DuplicateFieldName` |
//! | entity without fields or timestamps | `EmptyEntity` |
//! | relationship target missing | `UnknownTargetEntity` |
//! | `set-null` on a non-nullable key | `CascadePolicyConflict` |
//! | malformed entity, field or table name | `InvalidIdentifier` |
//! | entity named after a PHP reserved word | `ReservedIdentifier` |
//! | `id` field not marked `primary` | `ManualPrimaryKey` |

#ifndef SCHEMLY_SCHEMA_VALIDATOR_HPP
#define SCHEMLY_SCHEMA_VALIDATOR_HPP

#include "schema/error.hpp"
#include "schema/model.hpp"
#include "schema/options.hpp"

#include <set>
#include <string>
#include <vector>

namespace schemly::schema {

class SchemaValidator {
public:
    /// Runs every check and returns all errors in a stable order.
    [[nodiscard]] auto validate(const std::vector<Entity>& entities,
                                const std::vector<Pivot>& pivots, const GlobalOptions& options)
        -> ErrorList;

    /// Marks an entity whose fields did not all resolve. It is exempt from
    /// the `EmptyEntity` check.
    void mark_incomplete(const std::string& entity) {
        incomplete_.insert(entity);
    }

private:
    std::set<std::string> incomplete_;
    ErrorList errors_;

    void check_names(const std::vector<Entity>& entities, const std::vector<Pivot>& pivots);
    void check_entity(const Entity& entity);
    void check_pivot(const Pivot& pivot);
    void check_relationships(const Entity& entity, const std::vector<Entity>& entities);
};

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_VALIDATOR_HPP
