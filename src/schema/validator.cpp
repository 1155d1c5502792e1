//! # Schema Validator Implementation

#include "schema/validator.hpp"

#include "log/log.hpp"
#include "schema/naming.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace schemly::schema {

namespace {

auto entity_location(const Entity& entity) -> ErrorLocation {
    ErrorLocation where;
    where.entity = entity.name;
    where.mark = entity.mark;
    return where;
}

auto is_set_null(CascadePolicy on_delete, CascadePolicy on_update) -> bool {
    return on_delete == CascadePolicy::SetNull || on_update == CascadePolicy::SetNull;
}

auto find_entity(const std::vector<Entity>& entities, const std::string& name) -> const Entity* {
    auto it = std::find_if(entities.begin(), entities.end(),
                           [&](const Entity& e) { return e.name == name; });
    return it == entities.end() ? nullptr : &*it;
}

} // namespace

auto SchemaValidator::validate(const std::vector<Entity>& entities,
                               const std::vector<Pivot>& pivots, const GlobalOptions& options)
    -> ErrorList {
    errors_.clear();
    append_errors(errors_, validate_options(options));

    check_names(entities, pivots);
    for (const auto& entity : entities) {
        check_entity(entity);
        check_relationships(entity, entities);
    }
    for (const auto& pivot : pivots) {
        check_pivot(pivot);
    }

    SCHEMLY_LOG_DEBUG("validate", entities.size() << " entities, " << pivots.size() << " pivots, "
                                                  << errors_.size() << " errors");
    return std::move(errors_);
}

// ============================================================================
// Names
// ============================================================================

void SchemaValidator::check_names(const std::vector<Entity>& entities,
                                  const std::vector<Pivot>& pivots) {
    std::unordered_map<std::string, const Entity*> by_name;
    std::unordered_map<std::string, std::string> table_owner;

    for (const auto& entity : entities) {
        ErrorLocation where = entity_location(entity);

        if (!by_name.emplace(entity.name, &entity).second) {
            errors_.push_back(make_error(ErrorKind::DuplicateEntityName,
                                         "entity '" + entity.name + "' is declared more than once",
                                         where));
            continue;
        }

        if (!is_valid_identifier(entity.name)) {
            errors_.push_back(make_error(ErrorKind::InvalidIdentifier,
                                         "entity name '" + entity.name +
                                             "' is not a valid identifier",
                                         where));
        } else if (is_reserved_word(entity.name)) {
            auto err = make_error(ErrorKind::ReservedIdentifier,
                                  "entity name '" + entity.name + "' is a reserved word", where);
            err.notes.push_back("generated classes cannot be named after PHP keywords");
            errors_.push_back(std::move(err));
        }

        if (!is_valid_table_name(entity.table)) {
            errors_.push_back(make_error(ErrorKind::InvalidIdentifier,
                                         "table name '" + entity.table + "' is not valid", where));
        }

        auto [it, inserted] = table_owner.emplace(entity.table, entity.name);
        if (!inserted) {
            errors_.push_back(make_error(ErrorKind::DuplicateTableName,
                                         "table '" + entity.table + "' is used by both '" +
                                             it->second + "' and '" + entity.name + "'",
                                         where));
        }
    }

    for (const auto& pivot : pivots) {
        ErrorLocation where;
        where.pivot = pivot.name;
        where.mark = pivot.mark;
        if (!is_valid_table_name(pivot.name)) {
            errors_.push_back(make_error(ErrorKind::InvalidIdentifier,
                                         "pivot table name '" + pivot.name + "' is not valid",
                                         where));
        }
        auto it = table_owner.find(pivot.name);
        if (it != table_owner.end()) {
            errors_.push_back(make_error(ErrorKind::DuplicateTableName,
                                         "pivot table '" + pivot.name +
                                             "' collides with the table of entity '" + it->second +
                                             "'",
                                         where));
        }
    }
}

// ============================================================================
// Fields
// ============================================================================

void SchemaValidator::check_entity(const Entity& entity) {
    if (entity.fields.empty() && !entity.has_timestamps && incomplete_.count(entity.name) == 0) {
        auto err = make_error(ErrorKind::EmptyEntity,
                              "entity '" + entity.name + "' has no fields", entity_location(entity));
        err.notes.push_back("add a field or enable `timestamps`");
        errors_.push_back(std::move(err));
    }

    std::set<std::string> seen;
    for (const auto& field : entity.fields) {
        ErrorLocation where = entity_location(entity);
        where.field = field.name;
        where.mark = field.mark;

        if (!seen.insert(field.name).second) {
            errors_.push_back(make_error(ErrorKind::DuplicateFieldName,
                                         "field '" + field.name + "' is declared more than once",
                                         where));
            continue;
        }
        if (!is_valid_identifier(field.name)) {
            errors_.push_back(make_error(ErrorKind::InvalidIdentifier,
                                         "field name '" + field.name +
                                             "' is not a valid identifier",
                                         where));
        }
        if (field.name == "id" && !field.primary) {
            auto err = make_error(ErrorKind::ManualPrimaryKey,
                                  "field 'id' is generated automatically", where);
            err.notes.push_back("remove the field or mark it `primary: true`");
            errors_.push_back(std::move(err));
        }
    }
}

void SchemaValidator::check_pivot(const Pivot& pivot) {
    ErrorLocation base;
    base.pivot = pivot.name;
    base.mark = pivot.mark;

    std::set<std::string> seen{pivot.first_key, pivot.second_key};
    if (pivot.is_polymorphic()) {
        seen.insert(pivot.morph_type_column);
    }
    for (const auto& field : pivot.fields) {
        ErrorLocation where = base;
        where.field = field.name;
        where.mark = field.mark;
        if (!seen.insert(field.name).second) {
            errors_.push_back(make_error(ErrorKind::DuplicateFieldName,
                                         "pivot column '" + field.name +
                                             "' is declared more than once",
                                         where));
        }
    }
    for (const auto& column : pivot.extra_columns) {
        if (!is_valid_identifier(column)) {
            ErrorLocation where = base;
            where.field = column;
            errors_.push_back(make_error(ErrorKind::InvalidIdentifier,
                                         "pivot column '" + column + "' is not a valid identifier",
                                         where));
        }
    }
}

// ============================================================================
// Relationships
// ============================================================================

void SchemaValidator::check_relationships(const Entity& entity,
                                          const std::vector<Entity>& entities) {
    for (const auto& rel : entity.relationships) {
        ErrorLocation where = entity_location(entity);
        where.relationship = rel.method_name;
        where.mark = rel.mark;

        const std::string* target_name = rel.target();
        const Entity* target = nullptr;
        if (target_name != nullptr) {
            target = find_entity(entities, *target_name);
            if (target == nullptr) {
                errors_.push_back(make_error(ErrorKind::UnknownTargetEntity,
                                             "unknown target entity '" + *target_name + "'",
                                             where));
                continue;
            }
        }

        auto set_null_conflict = [&](const std::string& message) {
            auto err = make_error(ErrorKind::CascadePolicyConflict, message, where);
            err.notes.push_back("make the column nullable or choose another policy");
            errors_.push_back(std::move(err));
        };

        if (const auto* belongs = std::get_if<BelongsTo>(&rel.kind)) {
            if (is_set_null(belongs->on_delete, belongs->on_update)) {
                const Field* column = entity.find_field(belongs->foreign_key);
                if (column == nullptr || !column->nullable) {
                    set_null_conflict("set-null requires '" + entity.name + "." +
                                      belongs->foreign_key + "' to be nullable");
                }
            }
        } else if (const auto* has_one = std::get_if<HasOne>(&rel.kind)) {
            if (is_set_null(has_one->on_delete, has_one->on_update)) {
                const Field* column = target->find_field(has_one->foreign_key);
                if (column == nullptr || !column->nullable) {
                    set_null_conflict("set-null requires '" + target->name + "." +
                                      has_one->foreign_key + "' to be nullable");
                }
            }
        } else if (const auto* has_many = std::get_if<HasMany>(&rel.kind)) {
            if (is_set_null(has_many->on_delete, has_many->on_update)) {
                const Field* column = target->find_field(has_many->foreign_key);
                if (column == nullptr || !column->nullable) {
                    set_null_conflict("set-null requires '" + target->name + "." +
                                      has_many->foreign_key + "' to be nullable");
                }
            }
        } else if (const auto* many = std::get_if<BelongsToMany>(&rel.kind)) {
            if (is_set_null(many->on_delete, many->on_update)) {
                set_null_conflict("set-null cannot apply to pivot '" + many->pivot +
                                  "': pivot keys are never nullable");
            }
        }
    }
}

} // namespace schemly::schema
