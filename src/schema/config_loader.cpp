//! # Document Loader Implementation
//!
//! Every reader reports problems through `malformed()` and returns an empty
//! optional (or an empty container) so the caller can skip the item and keep
//! reading. yaml-cpp exceptions never leave this file.

#include "schema/config_loader.hpp"

#include "log/log.hpp"
#include "schema/naming.hpp"

#include <sstream>

namespace schemly::schema {

namespace {

auto undefined_node() -> YAML::Node {
    return YAML::Node(YAML::NodeType::Undefined);
}

/// Absent and explicit `~` both mean "not given".
auto is_absent(const YAML::Node& value) -> bool {
    return !value || value.IsNull();
}

auto mark_of(const YAML::Node& node) -> SourceMark {
    if (!node) {
        return {};
    }
    return to_source_mark(node.Mark());
}

auto with_field(const ErrorLocation& where, std::string field) -> ErrorLocation {
    ErrorLocation loc = where;
    loc.field = std::move(field);
    return loc;
}

/// Splits `max:50` or `between:1,10` into a rule and its parameters.
auto parse_rule_string(const std::string& text) -> ValidationRule {
    ValidationRule rule;
    auto colon = text.find(':');
    rule.rule = text.substr(0, colon);
    if (colon == std::string::npos) {
        return rule;
    }
    std::string rest = text.substr(colon + 1);
    std::istringstream iss(rest);
    std::string param;
    while (std::getline(iss, param, ',')) {
        rule.parameters.push_back(param);
    }
    return rule;
}

} // namespace

auto to_source_mark(const YAML::Mark& mark) -> SourceMark {
    if (mark.is_null() || mark.line < 0) {
        return {};
    }
    return SourceMark{static_cast<uint32_t>(mark.line + 1), static_cast<uint32_t>(mark.column + 1)};
}

auto lookup_key(const YAML::Node& node, std::string_view key) -> YAML::Node {
    if (!node || !node.IsMap()) {
        return undefined_node();
    }
    std::string primary(key);
    if (auto value = node[primary]) {
        return value;
    }
    std::string alias = snake_case(key);
    if (alias != primary) {
        if (auto value = node[alias]) {
            return value;
        }
    }
    return undefined_node();
}

// ============================================================================
// Entry Points
// ============================================================================

auto ConfigLoader::load_string(std::string_view text, std::string source_name)
    -> Result<RawSchema, ErrorList> {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        ErrorList errors;
        ErrorLocation where;
        where.mark = to_source_mark(e.mark);
        errors.push_back(make_error(ErrorKind::MalformedInput,
                                    "syntax error in " + source_name + ": " + e.msg, where));
        return errors;
    }
    return load_node(root, std::move(source_name));
}

auto ConfigLoader::load_file(const std::string& path) -> Result<RawSchema, ErrorList> {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        ErrorList errors;
        errors.push_back(make_error(ErrorKind::MalformedInput, "cannot open file '" + path + "'"));
        return errors;
    } catch (const YAML::ParserException& e) {
        ErrorList errors;
        ErrorLocation where;
        where.mark = to_source_mark(e.mark);
        errors.push_back(
            make_error(ErrorKind::MalformedInput, "syntax error in " + path + ": " + e.msg, where));
        return errors;
    }
    return load_node(root, path);
}

auto ConfigLoader::load_node(const YAML::Node& root, std::string source_name)
    -> Result<RawSchema, ErrorList> {
    errors_.clear();
    RawSchema schema;
    schema.source_name = std::move(source_name);

    SCHEMLY_LOG_DEBUG("config", "Loading schema document " << schema.source_name);

    if (!root || !root.IsMap()) {
        malformed("document root must be a mapping", {}, root);
        return std::move(errors_);
    }

    try {
        read_options(root, schema.options);

        auto models = lookup_key(root, "models");
        if (!models) {
            models = lookup_key(root, "entities");
        }
        if (is_absent(models)) {
            malformed("missing required key 'models'", {}, root);
        } else if (!models.IsSequence()) {
            malformed("'models' must be a sequence", {}, models);
        } else {
            for (const auto& node : models) {
                if (auto entity = read_entity(node)) {
                    schema.entities.push_back(std::move(*entity));
                }
            }
        }

        schema.pivots = read_pivots(root, "pivotTables", {});
    } catch (const YAML::Exception& e) {
        ErrorLocation where;
        where.mark = to_source_mark(e.mark);
        errors_.push_back(make_error(ErrorKind::MalformedInput, e.msg, where));
    }

    if (!errors_.empty()) {
        SCHEMLY_LOG_DEBUG("config", schema.source_name << ": " << errors_.size()
                                                       << " malformed item(s)");
        return std::move(errors_);
    }

    SCHEMLY_LOG_INFO("config", "Loaded " << schema.entities.size() << " entities and "
                                         << schema.pivots.size() << " pivot declarations from "
                                         << schema.source_name);
    return schema;
}

void ConfigLoader::malformed(std::string message, ErrorLocation where, const YAML::Node& node) {
    if (!where.mark.is_known()) {
        where.mark = mark_of(node);
    }
    errors_.push_back(make_error(ErrorKind::MalformedInput, std::move(message), std::move(where)));
}

// ============================================================================
// Declarations
// ============================================================================

void ConfigLoader::read_options(const YAML::Node& root, RawOptions& options) {
    const ErrorLocation top;
    options.output_dir = read_string(root, "outputDir", top);
    options.namespace_name = read_string(root, "namespace", top);
    options.generate_models = read_bool(root, "generateModels", top);
    options.generate_controllers = read_bool(root, "generateControllers", top);
    options.generate_resources = read_bool(root, "generateResources", top);
    options.generate_factories = read_bool(root, "generateFactories", top);
    options.generate_migrations = read_bool(root, "generateMigrations", top);
    options.generate_pivot_tables = read_bool(root, "generatePivotTables", top);
    options.generate_validation_rules = read_bool(root, "generateValidationRules", top);
    options.generate_dto = read_bool(root, "generateDto", top);
    options.use_ddd_structure = read_bool(root, "useDddStructure", top);
    options.database_engine = read_string(root, "databaseEngine", top);
    options.force_overwrite = read_bool(root, "forceOverwrite", top);
}

auto ConfigLoader::read_entity(const YAML::Node& node) -> std::optional<RawEntity> {
    if (!node.IsMap()) {
        malformed("model entry must be a mapping", {}, node);
        return std::nullopt;
    }

    RawEntity entity;
    entity.mark = mark_of(node);

    ErrorLocation where;
    where.mark = entity.mark;
    auto name = read_required(node, "name", where);
    if (!name) {
        return std::nullopt;
    }
    entity.name = *name;
    where.entity = entity.name;
    where.mark = {};

    entity.table = read_string(node, "table", where);
    entity.timestamps = read_bool(node, "timestamps", where);
    entity.soft_deletes = read_bool(node, "softDeletes", where);
    entity.traits = read_string_list(node, "traits", where);
    entity.validation_rules = read_rules(lookup_key(node, "validationRules"), where);

    auto fields = lookup_key(node, "fields");
    if (!is_absent(fields)) {
        if (!fields.IsSequence()) {
            malformed("'fields' must be a sequence", where, fields);
        } else {
            for (const auto& item : fields) {
                if (auto field = read_field(item, where)) {
                    entity.fields.push_back(std::move(*field));
                }
            }
        }
    }

    auto relationships = lookup_key(node, "relationships");
    if (!is_absent(relationships)) {
        if (!relationships.IsSequence()) {
            malformed("'relationships' must be a sequence", where, relationships);
        } else {
            for (const auto& item : relationships) {
                if (auto rel = read_relationship(item, where)) {
                    entity.relationships.push_back(std::move(*rel));
                }
            }
        }
    }

    entity.pivots = read_pivots(node, "pivotTables", where);

    bool has_fillable = !is_absent(lookup_key(node, "fillable"));
    bool has_guarded = !is_absent(lookup_key(node, "guarded"));
    if (has_fillable && has_guarded) {
        malformed("'fillable' and 'guarded' are mutually exclusive", where, node);
    } else if (has_fillable) {
        entity.mass_assignment.mode = MassAssignment::Mode::Fillable;
        entity.mass_assignment.columns = read_string_list(node, "fillable", where);
    } else if (has_guarded) {
        entity.mass_assignment.mode = MassAssignment::Mode::Guarded;
        entity.mass_assignment.columns = read_string_list(node, "guarded", where);
    }

    return entity;
}

auto ConfigLoader::read_field(const YAML::Node& node, const ErrorLocation& where)
    -> std::optional<RawField> {
    if (!node.IsMap()) {
        malformed("field entry must be a mapping", where, node);
        return std::nullopt;
    }

    RawField field;
    field.mark = mark_of(node);

    ErrorLocation loc = where;
    loc.mark = field.mark;
    auto name = read_required(node, "name", loc);
    if (!name) {
        return std::nullopt;
    }
    field.name = *name;
    loc = with_field(where, field.name);

    auto type = read_required(node, "type", loc);
    if (!type) {
        return std::nullopt;
    }
    field.type = *type;

    field.nullable = read_bool(node, "nullable", loc);
    field.unique = read_bool(node, "unique", loc);
    field.index = read_bool(node, "index", loc);
    field.is_unsigned = read_bool(node, "unsigned", loc);
    field.auto_increment = read_bool(node, "autoIncrement", loc);
    field.primary = read_bool(node, "primary", loc);
    field.length = read_size(node, "length", loc);
    field.comment = read_string(node, "comment", loc);
    field.cast_type = read_string(node, "castType", loc);
    field.default_value = read_string(node, "default", loc);

    auto decimal = lookup_key(node, "decimalPrecision");
    if (!is_absent(decimal)) {
        if (!decimal.IsMap()) {
            malformed("'decimalPrecision' must be a mapping with 'precision' and 'scale'", loc,
                      decimal);
        } else {
            field.precision = read_size(decimal, "precision", loc);
            field.scale = read_size(decimal, "scale", loc);
        }
    } else {
        field.precision = read_size(node, "precision", loc);
        field.scale = read_size(node, "scale", loc);
    }

    auto enum_values = lookup_key(node, "enumValues");
    if (!is_absent(enum_values)) {
        field.enum_values = read_enum_values(enum_values, loc);
    }

    field.validation_rules = read_rules(lookup_key(node, "validationRules"), loc);
    return field;
}

auto ConfigLoader::read_relationship(const YAML::Node& node, const ErrorLocation& where)
    -> std::optional<RawRelationship> {
    if (!node.IsMap()) {
        malformed("relationship entry must be a mapping", where, node);
        return std::nullopt;
    }

    RawRelationship rel;
    rel.mark = mark_of(node);

    ErrorLocation loc = where;
    loc.mark = rel.mark;
    auto kind = read_required(node, "type", loc);
    if (!kind) {
        return std::nullopt;
    }
    rel.kind = *kind;

    rel.target = read_string(node, "model", loc);
    if (!rel.target) {
        rel.target = read_string(node, "target", loc);
    }
    rel.name = read_string(node, "name", loc);
    if (rel.name) {
        loc.relationship = *rel.name;
    } else if (rel.target) {
        loc.relationship = rel.kind + " " + *rel.target;
    } else {
        loc.relationship = rel.kind;
    }

    rel.foreign_key = read_string(node, "foreignKey", loc);
    rel.local_key = read_string(node, "localKey", loc);
    rel.owner_key = read_string(node, "ownerKey", loc);
    rel.pivot_table = read_string(node, "pivotTable", loc);
    rel.foreign_pivot_key = read_string(node, "foreignPivotKey", loc);
    rel.related_pivot_key = read_string(node, "relatedPivotKey", loc);
    rel.pivot_fields = read_string_list(node, "pivotFields", loc);
    rel.with_timestamps = read_bool(node, "withTimestamps", loc);
    rel.morph_name = read_string(node, "morphName", loc);
    rel.on_delete = read_string(node, "onDelete", loc);
    rel.on_update = read_string(node, "onUpdate", loc);
    return rel;
}

auto ConfigLoader::read_pivot(const YAML::Node& node, const ErrorLocation& where)
    -> std::optional<RawPivot> {
    if (!node.IsMap()) {
        malformed("pivot table entry must be a mapping", where, node);
        return std::nullopt;
    }

    RawPivot pivot;
    pivot.mark = mark_of(node);

    ErrorLocation loc = where;
    loc.mark = pivot.mark;
    auto name = read_required(node, "name", loc);
    if (name) {
        loc.pivot = *name;
    }
    auto first = read_required(node, "model1", loc);
    auto second = read_required(node, "model2", loc);
    if (!name || !first || !second) {
        return std::nullopt;
    }
    pivot.name = *name;
    pivot.first = *first;
    pivot.second = *second;
    pivot.first_key = read_string(node, "foreignKey1", loc);
    pivot.second_key = read_string(node, "foreignKey2", loc);
    pivot.timestamps = read_bool(node, "timestamps", loc);

    auto extra = lookup_key(node, "additionalFields");
    if (!is_absent(extra)) {
        if (!extra.IsSequence()) {
            malformed("'additionalFields' must be a sequence", loc, extra);
        } else {
            ErrorLocation field_loc = loc;
            field_loc.mark = {};
            for (const auto& item : extra) {
                if (auto field = read_field(item, field_loc)) {
                    pivot.additional_fields.push_back(std::move(*field));
                }
            }
        }
    }
    return pivot;
}

auto ConfigLoader::read_pivots(const YAML::Node& node, std::string_view key,
                               const ErrorLocation& where) -> std::vector<RawPivot> {
    std::vector<RawPivot> pivots;
    auto list = lookup_key(node, key);
    if (is_absent(list)) {
        return pivots;
    }
    if (!list.IsSequence()) {
        malformed("'" + std::string(key) + "' must be a sequence", where, list);
        return pivots;
    }
    for (const auto& item : list) {
        if (auto pivot = read_pivot(item, where)) {
            pivots.push_back(std::move(*pivot));
        }
    }
    return pivots;
}

auto ConfigLoader::read_enum_values(const YAML::Node& node, const ErrorLocation& where)
    -> std::optional<std::vector<RawEnumValue>> {
    if (!node.IsSequence()) {
        malformed("'enumValues' must be a sequence", where, node);
        return std::nullopt;
    }

    std::vector<RawEnumValue> values;
    for (const auto& item : node) {
        if (item.IsScalar()) {
            values.push_back(RawEnumValue{item.as<std::string>(), std::nullopt});
        } else if (item.IsMap()) {
            ErrorLocation loc = where;
            loc.mark = mark_of(item);
            auto value = read_required(item, "value", loc);
            if (!value) {
                continue;
            }
            values.push_back(RawEnumValue{*value, read_string(item, "label", loc)});
        } else {
            malformed("enum value must be a scalar or a mapping with 'value'", where, item);
        }
    }
    return values;
}

auto ConfigLoader::read_rules(const YAML::Node& node, const ErrorLocation& where)
    -> std::vector<ValidationRule> {
    std::vector<ValidationRule> rules;
    if (is_absent(node)) {
        return rules;
    }
    if (!node.IsSequence()) {
        malformed("'validationRules' must be a sequence", where, node);
        return rules;
    }

    for (const auto& item : node) {
        if (item.IsScalar()) {
            rules.push_back(parse_rule_string(item.as<std::string>()));
        } else if (item.IsMap()) {
            ErrorLocation loc = where;
            loc.mark = mark_of(item);
            auto rule = read_required(item, "rule", loc);
            if (!rule) {
                continue;
            }
            rules.push_back(ValidationRule{*rule, read_string_list(item, "parameters", loc)});
        } else {
            malformed("validation rule must be a scalar or a mapping with 'rule'", where, item);
        }
    }
    return rules;
}

// ============================================================================
// Scalars
// ============================================================================

auto ConfigLoader::read_string(const YAML::Node& node, std::string_view key,
                               const ErrorLocation& where) -> std::optional<std::string> {
    auto value = lookup_key(node, key);
    if (is_absent(value)) {
        return std::nullopt;
    }
    if (!value.IsScalar()) {
        malformed("key '" + std::string(key) + "' must be a scalar", where, value);
        return std::nullopt;
    }
    return value.as<std::string>();
}

auto ConfigLoader::read_required(const YAML::Node& node, std::string_view key,
                                 const ErrorLocation& where) -> std::optional<std::string> {
    auto value = read_string(node, key, where);
    if (!value) {
        if (is_absent(lookup_key(node, key))) {
            malformed("missing required key '" + std::string(key) + "'", where, node);
        }
        return std::nullopt;
    }
    if (value->empty()) {
        malformed("key '" + std::string(key) + "' must not be empty", where, node);
        return std::nullopt;
    }
    return value;
}

auto ConfigLoader::read_bool(const YAML::Node& node, std::string_view key,
                             const ErrorLocation& where) -> std::optional<bool> {
    auto value = lookup_key(node, key);
    if (is_absent(value)) {
        return std::nullopt;
    }
    if (!value.IsScalar()) {
        malformed("key '" + std::string(key) + "' must be a boolean", where, value);
        return std::nullopt;
    }
    try {
        return value.as<bool>();
    } catch (const YAML::BadConversion&) {
        malformed("key '" + std::string(key) + "' must be a boolean, got '" +
                      value.as<std::string>() + "'",
                  where, value);
        return std::nullopt;
    }
}

auto ConfigLoader::read_size(const YAML::Node& node, std::string_view key,
                             const ErrorLocation& where) -> std::optional<int64_t> {
    auto value = lookup_key(node, key);
    if (is_absent(value)) {
        return std::nullopt;
    }
    if (!value.IsScalar()) {
        malformed("key '" + std::string(key) + "' must be an integer", where, value);
        return std::nullopt;
    }
    int64_t number = 0;
    try {
        number = value.as<int64_t>();
    } catch (const YAML::BadConversion&) {
        malformed("key '" + std::string(key) + "' must be an integer, got '" +
                      value.as<std::string>() + "'",
                  where, value);
        return std::nullopt;
    }
    if (number < 0) {
        malformed("key '" + std::string(key) + "' must not be negative", where, value);
        return std::nullopt;
    }
    return number;
}

auto ConfigLoader::read_string_list(const YAML::Node& node, std::string_view key,
                                    const ErrorLocation& where) -> std::vector<std::string> {
    std::vector<std::string> result;
    auto value = lookup_key(node, key);
    if (is_absent(value)) {
        return result;
    }
    if (!value.IsSequence()) {
        malformed("key '" + std::string(key) + "' must be a sequence", where, value);
        return result;
    }
    result.reserve(value.size());
    for (const auto& entry : value) {
        if (!entry.IsScalar()) {
            malformed("entries of '" + std::string(key) + "' must be scalars", where, entry);
            continue;
        }
        result.push_back(entry.as<std::string>());
    }
    return result;
}

} // namespace schemly::schema
