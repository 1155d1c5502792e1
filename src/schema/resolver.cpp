//! # Schema Resolver Implementation

#include "schema/resolver.hpp"

#include "log/log.hpp"
#include "schema/config_loader.hpp"
#include "schema/dependency_graph.hpp"
#include "schema/field_resolver.hpp"
#include "schema/naming.hpp"
#include "schema/options.hpp"
#include "schema/pivot_registry.hpp"
#include "schema/relationship_resolver.hpp"
#include "schema/validator.hpp"

#include <unordered_map>
#include <utility>

namespace schemly::schema {

namespace {

/// Where a pivot claim came from, so its keys can be copied back.
struct PendingClaim {
    size_t entity;
    size_t relationship;
    ClaimId id;
};

void declare_pivot(const RawPivot& raw, const SchemaIndex& index, PivotRegistry& registry,
                   ErrorList& errors) {
    ErrorLocation where;
    where.pivot = raw.name;
    where.mark = raw.mark;

    bool ok = true;
    for (const std::string* entity : {&raw.first, &raw.second}) {
        if (index.find(*entity) == nullptr) {
            errors.push_back(make_error(ErrorKind::UnknownTargetEntity,
                                        "pivot '" + raw.name + "' references unknown entity '" +
                                            *entity + "'",
                                        where));
            ok = false;
        }
    }

    Pivot pivot;
    pivot.name = raw.name;
    pivot.first_entity = raw.first;
    pivot.second_entity = raw.second;
    pivot.first_key = raw.first_key.value_or(foreign_key_for(raw.first));
    if (raw.second_key) {
        pivot.second_key = *raw.second_key;
    } else if (raw.first == raw.second) {
        pivot.second_key = self_related_key_for(raw.second);
    } else {
        pivot.second_key = foreign_key_for(raw.second);
    }
    pivot.timestamps = raw.timestamps.value_or(false);
    pivot.mark = raw.mark;

    if (pivot.first_key == pivot.second_key) {
        errors.push_back(make_error(ErrorKind::PivotKeyConflict,
                                    "both sides of pivot '" + raw.name + "' use column '" +
                                        pivot.first_key + "'",
                                    where));
        ok = false;
    }

    for (const auto& raw_field : raw.additional_fields) {
        auto field = resolve_field(raw_field, raw.name);
        if (is_err(field)) {
            append_errors(errors, std::move(unwrap_err(field)));
            ok = false;
            continue;
        }
        pivot.fields.push_back(std::move(unwrap(field)));
    }

    if (ok) {
        registry.declare(std::move(pivot), where);
    }
}

} // namespace

auto SchemaResolver::resolve(const RawSchema& raw) -> Result<ResolvedSchema, ErrorList> {
    ErrorList errors;

    // Options
    GlobalOptions options;
    auto resolved_options = resolve_options(raw.options);
    if (is_err(resolved_options)) {
        append_errors(errors, std::move(unwrap_err(resolved_options)));
    } else {
        options = std::move(unwrap(resolved_options));
    }
    if (settings_.use_environment) {
        apply_env_overrides(options);
    }

    SchemaIndex index(raw);
    PivotRegistry registry;
    RelationshipResolver relationships(index, registry);
    SchemaValidator validator;

    // Declared pivots
    for (const auto& pivot : raw.pivots) {
        declare_pivot(pivot, index, registry, errors);
    }
    for (const auto& entity : raw.entities) {
        for (const auto& pivot : entity.pivots) {
            declare_pivot(pivot, index, registry, errors);
        }
    }

    // Entities
    std::vector<Entity> entities;
    std::vector<PendingClaim> claims;
    entities.reserve(raw.entities.size());
    for (const auto& raw_entity : raw.entities) {
        Entity entity;
        entity.name = raw_entity.name;
        entity.table = table_of(raw_entity);
        entity.primary_key = primary_key_of(raw_entity);
        entity.has_timestamps = raw_entity.timestamps.value_or(false);
        entity.has_soft_deletes = raw_entity.soft_deletes.value_or(false);
        entity.traits = raw_entity.traits;
        entity.mass_assignment = raw_entity.mass_assignment;
        entity.validation_rules = raw_entity.validation_rules;
        entity.mark = raw_entity.mark;

        for (const auto& raw_field : raw_entity.fields) {
            auto field = resolve_field(raw_field, raw_entity.name);
            if (is_err(field)) {
                append_errors(errors, std::move(unwrap_err(field)));
                validator.mark_incomplete(raw_entity.name);
                continue;
            }
            entity.fields.push_back(std::move(unwrap(field)));
        }

        for (size_t i = 0; i < raw_entity.relationships.size(); ++i) {
            auto rel = relationships.resolve(raw_entity.relationships[i], raw_entity, i);
            if (is_err(rel)) {
                errors.push_back(std::move(unwrap_err(rel)));
                continue;
            }
            auto& resolved = unwrap(rel);
            if (resolved.claim) {
                claims.push_back(
                    PendingClaim{entities.size(), entity.relationships.size(), *resolved.claim});
            }
            entity.relationships.push_back(std::move(resolved.relationship));
        }

        SCHEMLY_LOG_DEBUG("resolve", entity.name << " (" << entity.table << "): "
                                                 << entity.fields.size() << " fields, "
                                                 << entity.relationships.size()
                                                 << " relationships");
        entities.push_back(std::move(entity));
    }

    // Pivots
    append_errors(errors, registry.finalize());
    for (const auto& pending : claims) {
        if (auto keys = registry.keys_for(pending.id)) {
            RelationshipResolver::apply_pivot_keys(
                entities[pending.entity].relationships[pending.relationship], *keys);
        }
    }
    const std::vector<Pivot>& pivots = registry.pivots();

    // Emission order
    auto graph = DependencyGraph::build(entities, pivots);
    auto sorted = graph.sort();
    if (is_err(sorted)) {
        append_errors(errors, std::move(unwrap_err(sorted)));
    }

    // Validation
    append_errors(errors, validator.validate(entities, pivots, options));

    if (!errors.empty()) {
        SCHEMLY_LOG_INFO("resolve", raw.source_name << ": " << errors.size() << " errors");
        return errors;
    }

    ResolvedSchema schema;
    schema.options = std::move(options);
    schema.emission_order = std::move(unwrap(sorted));

    std::unordered_map<std::string, size_t> entity_at;
    for (size_t i = 0; i < entities.size(); ++i) {
        entity_at.emplace(entities[i].name, i);
    }
    std::unordered_map<std::string, size_t> pivot_at;
    for (size_t i = 0; i < pivots.size(); ++i) {
        pivot_at.emplace(pivots[i].name, i);
    }
    for (const auto& step : schema.emission_order) {
        if (step.kind == EmissionStep::Kind::Entity) {
            schema.entities.push_back(std::move(entities[entity_at.at(step.name)]));
        } else {
            schema.pivots.push_back(pivots[pivot_at.at(step.name)]);
        }
    }

    SCHEMLY_LOG_INFO("resolve", raw.source_name << ": resolved " << schema.entities.size()
                                                << " entities, " << schema.pivots.size()
                                                << " pivots");
    return schema;
}

auto SchemaResolver::resolve_string(std::string_view text, std::string source_name)
    -> Result<ResolvedSchema, ErrorList> {
    ConfigLoader loader;
    auto raw = loader.load_string(text, std::move(source_name));
    if (is_err(raw)) {
        return std::move(unwrap_err(raw));
    }
    return resolve(unwrap(raw));
}

auto SchemaResolver::resolve_file(const std::string& path) -> Result<ResolvedSchema, ErrorList> {
    ConfigLoader loader;
    auto raw = loader.load_file(path);
    if (is_err(raw)) {
        return std::move(unwrap_err(raw));
    }
    return resolve(unwrap(raw));
}

} // namespace schemly::schema
