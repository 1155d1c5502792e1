//! # JSON Export Implementation

#include "schema/export.hpp"

#include <type_traits>
#include <utility>

namespace schemly::schema {

using json::JsonArray;
using json::JsonObject;
using json::JsonValue;
using json::json_bool;
using json::json_int;
using json::json_null;
using json::json_string;
using json::json_string_array;

namespace {

auto optional_string(const std::optional<std::string>& value) -> JsonValue {
    return value ? json_string(*value) : json_null();
}

auto mark_to_json(const SourceMark& mark) -> JsonValue {
    if (!mark.is_known()) {
        return json_null();
    }
    JsonObject obj;
    obj.emplace("line", json_int(mark.line));
    obj.emplace("column", json_int(mark.column));
    return JsonValue(std::move(obj));
}

auto rules_to_json(const std::vector<ValidationRule>& rules) -> JsonValue {
    JsonArray arr;
    for (const auto& rule : rules) {
        JsonObject obj;
        obj.emplace("rule", json_string(rule.rule));
        obj.emplace("parameters", json_string_array(rule.parameters));
        arr.push_back(JsonValue(std::move(obj)));
    }
    return JsonValue(std::move(arr));
}

auto mass_assignment_to_json(const MassAssignment& policy) -> JsonValue {
    JsonObject obj;
    switch (policy.mode) {
    case MassAssignment::Mode::All:
        obj.emplace("mode", json_string("all"));
        break;
    case MassAssignment::Mode::Fillable:
        obj.emplace("mode", json_string("fillable"));
        break;
    case MassAssignment::Mode::Guarded:
        obj.emplace("mode", json_string("guarded"));
        break;
    }
    obj.emplace("columns", json_string_array(policy.columns));
    return JsonValue(std::move(obj));
}

auto options_to_json(const GlobalOptions& options) -> JsonValue {
    JsonObject obj;
    obj.emplace("outputDir", json_string(options.output_dir));
    obj.emplace("namespace", json_string(options.namespace_name));
    obj.emplace("generateModels", json_bool(options.generate_models));
    obj.emplace("generateControllers", json_bool(options.generate_controllers));
    obj.emplace("generateResources", json_bool(options.generate_resources));
    obj.emplace("generateFactories", json_bool(options.generate_factories));
    obj.emplace("generateMigrations", json_bool(options.generate_migrations));
    obj.emplace("generatePivotTables", json_bool(options.generate_pivot_tables));
    obj.emplace("generateValidationRules", json_bool(options.generate_validation_rules));
    obj.emplace("generateDto", json_bool(options.generate_dto));
    obj.emplace("useDddStructure", json_bool(options.use_ddd_structure));
    obj.emplace("databaseEngine", json_string(options.database_engine));
    obj.emplace("forceOverwrite", json_bool(options.force_overwrite));
    return JsonValue(std::move(obj));
}

void add_cascade(JsonObject& obj, CascadePolicy on_delete, CascadePolicy on_update) {
    obj.emplace("onDelete", json_string(cascade_policy_name(on_delete)));
    obj.emplace("onUpdate", json_string(cascade_policy_name(on_update)));
}

} // namespace

// ============================================================================
// Schema
// ============================================================================

auto to_json(const Field& field) -> JsonValue {
    JsonObject obj;
    obj.emplace("name", json_string(field.name));
    obj.emplace("type", json_string(field_type_name(field.type)));
    obj.emplace("nullable", json_bool(field.nullable));
    obj.emplace("unique", json_bool(field.unique));
    obj.emplace("index", json_bool(field.indexed));
    obj.emplace("unsigned", json_bool(field.is_unsigned));
    obj.emplace("autoIncrement", json_bool(field.auto_increment));
    obj.emplace("primary", json_bool(field.primary));
    obj.emplace("length", field.length ? JsonValue(*field.length) : json_null());
    if (field.decimal) {
        JsonObject decimal;
        decimal.emplace("precision", JsonValue(field.decimal->precision));
        decimal.emplace("scale", JsonValue(field.decimal->scale));
        obj.emplace("decimal", JsonValue(std::move(decimal)));
    } else {
        obj.emplace("decimal", json_null());
    }
    JsonArray values;
    for (const auto& value : field.enum_values) {
        JsonObject entry;
        entry.emplace("value", json_string(value.value));
        entry.emplace("label", json_string(value.label));
        values.push_back(JsonValue(std::move(entry)));
    }
    obj.emplace("enumValues", JsonValue(std::move(values)));
    obj.emplace("default", optional_string(field.default_value));
    obj.emplace("comment", optional_string(field.comment));
    obj.emplace("cast", optional_string(field.cast));
    obj.emplace("rules", rules_to_json(field.validation_rules));
    return JsonValue(std::move(obj));
}

auto to_json(const Relationship& relationship) -> JsonValue {
    JsonObject obj;
    obj.emplace("method", json_string(relationship.method_name));
    obj.emplace("kind", json_string(relation_type_name(relationship.type())));
    std::visit(
        [&obj](const auto& rel) {
            using T = std::decay_t<decltype(rel)>;
            if constexpr (std::is_same_v<T, BelongsTo>) {
                obj.emplace("target", json_string(rel.target));
                obj.emplace("foreignKey", json_string(rel.foreign_key));
                obj.emplace("ownerKey", json_string(rel.owner_key));
                add_cascade(obj, rel.on_delete, rel.on_update);
            } else if constexpr (std::is_same_v<T, HasOne> || std::is_same_v<T, HasMany>) {
                obj.emplace("target", json_string(rel.target));
                obj.emplace("foreignKey", json_string(rel.foreign_key));
                obj.emplace("localKey", json_string(rel.local_key));
                add_cascade(obj, rel.on_delete, rel.on_update);
            } else if constexpr (std::is_same_v<T, BelongsToMany>) {
                obj.emplace("target", json_string(rel.target));
                obj.emplace("pivot", json_string(rel.pivot));
                obj.emplace("foreignPivotKey", json_string(rel.foreign_pivot_key));
                obj.emplace("relatedPivotKey", json_string(rel.related_pivot_key));
                obj.emplace("parentKey", json_string(rel.parent_key));
                obj.emplace("relatedKey", json_string(rel.related_key));
                obj.emplace("withTimestamps", json_bool(rel.with_timestamps));
                obj.emplace("pivotFields", json_string_array(rel.pivot_fields));
                add_cascade(obj, rel.on_delete, rel.on_update);
            } else if constexpr (std::is_same_v<T, MorphTo>) {
                obj.emplace("morphName", json_string(rel.morph_name));
                obj.emplace("typeColumn", json_string(rel.type_column));
                obj.emplace("idColumn", json_string(rel.id_column));
            } else if constexpr (std::is_same_v<T, MorphOne> || std::is_same_v<T, MorphMany>) {
                obj.emplace("target", json_string(rel.target));
                obj.emplace("morphName", json_string(rel.morph_name));
                obj.emplace("localKey", json_string(rel.local_key));
            } else {
                obj.emplace("target", json_string(rel.target));
                obj.emplace("morphName", json_string(rel.morph_name));
                obj.emplace("pivot", json_string(rel.pivot));
                obj.emplace("foreignPivotKey", json_string(rel.foreign_pivot_key));
                obj.emplace("relatedPivotKey", json_string(rel.related_pivot_key));
                obj.emplace("morphTypeColumn", json_string(rel.morph_type_column));
                obj.emplace("withTimestamps", json_bool(rel.with_timestamps));
            }
        },
        relationship.kind);
    return JsonValue(std::move(obj));
}

auto to_json(const Entity& entity) -> JsonValue {
    JsonObject obj;
    obj.emplace("name", json_string(entity.name));
    obj.emplace("table", json_string(entity.table));
    obj.emplace("primaryKey", json_string(entity.primary_key));
    JsonArray fields;
    for (const auto& field : entity.fields) {
        fields.push_back(to_json(field));
    }
    obj.emplace("fields", JsonValue(std::move(fields)));
    JsonArray relationships;
    for (const auto& rel : entity.relationships) {
        relationships.push_back(to_json(rel));
    }
    obj.emplace("relationships", JsonValue(std::move(relationships)));
    obj.emplace("timestamps", json_bool(entity.has_timestamps));
    obj.emplace("softDeletes", json_bool(entity.has_soft_deletes));
    obj.emplace("traits", json_string_array(entity.traits));
    obj.emplace("massAssignment", mass_assignment_to_json(entity.mass_assignment));
    obj.emplace("rules", rules_to_json(entity.validation_rules));
    return JsonValue(std::move(obj));
}

auto to_json(const Pivot& pivot) -> JsonValue {
    JsonObject obj;
    obj.emplace("name", json_string(pivot.name));
    obj.emplace("firstEntity", json_string(pivot.first_entity));
    obj.emplace("firstKey", json_string(pivot.first_key));
    obj.emplace("secondEntity", pivot.is_polymorphic() ? json_null()
                                                       : json_string(pivot.second_entity));
    obj.emplace("secondKey", json_string(pivot.second_key));
    obj.emplace("timestamps", json_bool(pivot.timestamps));
    obj.emplace("declared", json_bool(pivot.declared));
    JsonArray fields;
    for (const auto& field : pivot.fields) {
        fields.push_back(to_json(field));
    }
    obj.emplace("fields", JsonValue(std::move(fields)));
    obj.emplace("extraColumns", json_string_array(pivot.extra_columns));
    if (pivot.is_polymorphic()) {
        JsonObject morph;
        morph.emplace("name", json_string(*pivot.morph_name));
        morph.emplace("typeColumn", json_string(pivot.morph_type_column));
        morph.emplace("entities", json_string_array(pivot.morph_entities));
        obj.emplace("morph", JsonValue(std::move(morph)));
    } else {
        obj.emplace("morph", json_null());
    }
    return JsonValue(std::move(obj));
}

auto to_json(const ResolvedSchema& schema) -> JsonValue {
    JsonObject obj;
    obj.emplace("version", json_string(VERSION));
    obj.emplace("options", options_to_json(schema.options));

    JsonArray entities;
    for (const auto& entity : schema.entities) {
        entities.push_back(to_json(entity));
    }
    obj.emplace("entities", JsonValue(std::move(entities)));

    JsonArray pivots;
    for (const auto& pivot : schema.pivots) {
        pivots.push_back(to_json(pivot));
    }
    obj.emplace("pivots", JsonValue(std::move(pivots)));

    JsonArray order;
    for (const auto& step : schema.emission_order) {
        JsonObject entry;
        entry.emplace("kind", json_string(step.kind == EmissionStep::Kind::Entity ? "entity"
                                                                                  : "pivot"));
        entry.emplace("name", json_string(step.name));
        order.push_back(JsonValue(std::move(entry)));
    }
    obj.emplace("emissionOrder", JsonValue(std::move(order)));
    return JsonValue(std::move(obj));
}

// ============================================================================
// Errors
// ============================================================================

auto errors_to_json(const ErrorList& errors) -> JsonValue {
    JsonArray list;
    for (const auto& err : errors) {
        JsonObject obj;
        obj.emplace("code", json_string(err.code()));
        obj.emplace("kind", json_string(error_kind_name(err.kind)));
        obj.emplace("message", json_string(err.message));

        JsonObject location;
        auto put = [&location](const char* key, const std::string& value) {
            location.emplace(key, value.empty() ? json_null() : json_string(value));
        };
        put("entity", err.location.entity);
        put("field", err.location.field);
        put("relationship", err.location.relationship);
        put("pivot", err.location.pivot);
        location.emplace("mark", mark_to_json(err.location.mark));
        obj.emplace("location", JsonValue(std::move(location)));
        obj.emplace("notes", json_string_array(err.notes));
        list.push_back(JsonValue(std::move(obj)));
    }
    JsonObject out;
    out.emplace("count", json_int(static_cast<int64_t>(errors.size())));
    out.emplace("errors", JsonValue(std::move(list)));
    return JsonValue(std::move(out));
}

} // namespace schemly::schema
