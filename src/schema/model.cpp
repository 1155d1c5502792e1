//! # Resolved Schema Model Implementation

#include "schema/model.hpp"

#include "schema/naming.hpp"

#include <algorithm>
#include <type_traits>

namespace schemly::schema {

namespace {

/// Lowercases and drops `_`, `-` and spaces: `set_null` -> `setnull`.
auto normalize_spelling(std::string_view spelling) -> std::string {
    std::string out;
    out.reserve(spelling.size());
    for (char c : to_lower(spelling)) {
        if (c != '_' && c != '-' && c != ' ') {
            out += c;
        }
    }
    return out;
}

struct TypeSpelling {
    std::string_view spelling;
    FieldType type;
};

constexpr TypeSpelling FIELD_TYPE_SPELLINGS[] = {
    {"string", FieldType::String},
    {"varchar", FieldType::String},
    {"text", FieldType::Text},
    {"mediumtext", FieldType::MediumText},
    {"longtext", FieldType::LongText},
    {"tinyinteger", FieldType::TinyInteger},
    {"smallinteger", FieldType::SmallInteger},
    {"mediuminteger", FieldType::MediumInteger},
    {"integer", FieldType::Integer},
    {"int", FieldType::Integer},
    {"biginteger", FieldType::BigInteger},
    {"bigint", FieldType::BigInteger},
    {"float", FieldType::Float},
    {"double", FieldType::Float},
    {"decimal", FieldType::Decimal},
    {"boolean", FieldType::Boolean},
    {"bool", FieldType::Boolean},
    {"date", FieldType::Date},
    {"datetime", FieldType::DateTime},
    {"timestamp", FieldType::Timestamp},
    {"time", FieldType::Time},
    {"json", FieldType::Json},
    {"uuid", FieldType::Uuid},
    {"enum", FieldType::Enum},
    {"binary", FieldType::Binary},
    {"ipaddress", FieldType::IpAddress},
    {"inet", FieldType::IpAddress},
};

} // namespace

// ============================================================================
// Field Types
// ============================================================================

auto parse_field_type(std::string_view spelling) -> std::optional<FieldType> {
    std::string key = normalize_spelling(spelling);
    for (const auto& entry : FIELD_TYPE_SPELLINGS) {
        if (entry.spelling == key) {
            return entry.type;
        }
    }
    return std::nullopt;
}

auto field_type_name(FieldType type) -> const char* {
    switch (type) {
    case FieldType::String:
        return "string";
    case FieldType::Text:
        return "text";
    case FieldType::MediumText:
        return "mediumText";
    case FieldType::LongText:
        return "longText";
    case FieldType::TinyInteger:
        return "tinyInteger";
    case FieldType::SmallInteger:
        return "smallInteger";
    case FieldType::MediumInteger:
        return "mediumInteger";
    case FieldType::Integer:
        return "integer";
    case FieldType::BigInteger:
        return "bigInteger";
    case FieldType::Float:
        return "float";
    case FieldType::Decimal:
        return "decimal";
    case FieldType::Boolean:
        return "boolean";
    case FieldType::Date:
        return "date";
    case FieldType::DateTime:
        return "dateTime";
    case FieldType::Timestamp:
        return "timestamp";
    case FieldType::Time:
        return "time";
    case FieldType::Json:
        return "json";
    case FieldType::Uuid:
        return "uuid";
    case FieldType::Enum:
        return "enum";
    case FieldType::Binary:
        return "binary";
    case FieldType::IpAddress:
        return "ipAddress";
    }
    return "string";
}

auto default_cast(FieldType type) -> std::optional<std::string> {
    switch (type) {
    case FieldType::Boolean:
        return "boolean";
    case FieldType::TinyInteger:
    case FieldType::SmallInteger:
    case FieldType::MediumInteger:
    case FieldType::Integer:
    case FieldType::BigInteger:
        return "integer";
    case FieldType::Float:
    case FieldType::Decimal:
        return "float";
    case FieldType::Json:
        return "array";
    case FieldType::DateTime:
    case FieldType::Timestamp:
        return "datetime";
    case FieldType::Date:
        return "date";
    default:
        return std::nullopt;
    }
}

auto is_integer_type(FieldType type) -> bool {
    switch (type) {
    case FieldType::TinyInteger:
    case FieldType::SmallInteger:
    case FieldType::MediumInteger:
    case FieldType::Integer:
    case FieldType::BigInteger:
        return true;
    default:
        return false;
    }
}

auto is_string_type(FieldType type) -> bool {
    return type == FieldType::String;
}

// ============================================================================
// Cascade Policies and Relation Types
// ============================================================================

auto parse_cascade_policy(std::string_view spelling) -> std::optional<CascadePolicy> {
    std::string key = normalize_spelling(spelling);
    if (key == "cascade") {
        return CascadePolicy::Cascade;
    }
    if (key == "restrict") {
        return CascadePolicy::Restrict;
    }
    if (key == "setnull") {
        return CascadePolicy::SetNull;
    }
    if (key == "none" || key == "noaction") {
        return CascadePolicy::None;
    }
    return std::nullopt;
}

auto cascade_policy_name(CascadePolicy policy) -> const char* {
    switch (policy) {
    case CascadePolicy::Cascade:
        return "cascade";
    case CascadePolicy::Restrict:
        return "restrict";
    case CascadePolicy::SetNull:
        return "set-null";
    case CascadePolicy::None:
        return "none";
    }
    return "restrict";
}

auto parse_relation_type(std::string_view spelling) -> std::optional<RelationType> {
    std::string key = normalize_spelling(spelling);
    if (key == "belongsto") {
        return RelationType::BelongsTo;
    }
    if (key == "hasone") {
        return RelationType::HasOne;
    }
    if (key == "hasmany") {
        return RelationType::HasMany;
    }
    if (key == "belongstomany") {
        return RelationType::BelongsToMany;
    }
    if (key == "morphto") {
        return RelationType::MorphTo;
    }
    if (key == "morphone") {
        return RelationType::MorphOne;
    }
    if (key == "morphmany") {
        return RelationType::MorphMany;
    }
    if (key == "morphtomany") {
        return RelationType::MorphToMany;
    }
    return std::nullopt;
}

auto relation_type_name(RelationType type) -> const char* {
    switch (type) {
    case RelationType::BelongsTo:
        return "belongsTo";
    case RelationType::HasOne:
        return "hasOne";
    case RelationType::HasMany:
        return "hasMany";
    case RelationType::BelongsToMany:
        return "belongsToMany";
    case RelationType::MorphTo:
        return "morphTo";
    case RelationType::MorphOne:
        return "morphOne";
    case RelationType::MorphMany:
        return "morphMany";
    case RelationType::MorphToMany:
        return "morphToMany";
    }
    return "belongsTo";
}

auto is_to_many(RelationType type) -> bool {
    return type == RelationType::HasMany || type == RelationType::BelongsToMany ||
           type == RelationType::MorphMany || type == RelationType::MorphToMany;
}

auto accepts_cascade(RelationType type) -> bool {
    return type == RelationType::BelongsTo || type == RelationType::HasOne ||
           type == RelationType::HasMany || type == RelationType::BelongsToMany;
}

// ============================================================================
// Lookups
// ============================================================================

auto Relationship::target() const -> const std::string* {
    return std::visit(
        [](const auto& rel) -> const std::string* {
            using T = std::decay_t<decltype(rel)>;
            if constexpr (std::is_same_v<T, MorphTo>) {
                return nullptr;
            } else {
                return &rel.target;
            }
        },
        kind);
}

auto Entity::find_field(std::string_view field_name) const -> const Field* {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const Field& f) { return f.name == field_name; });
    return it == fields.end() ? nullptr : &*it;
}

auto Pivot::referenced_entities() const -> std::vector<std::string> {
    std::vector<std::string> refs;
    if (!first_entity.empty()) {
        refs.push_back(first_entity);
    }
    if (!second_entity.empty() && second_entity != first_entity) {
        refs.push_back(second_entity);
    }
    return refs;
}

auto ResolvedSchema::find_entity(std::string_view name) const -> const Entity* {
    auto it = std::find_if(entities.begin(), entities.end(),
                           [&](const Entity& e) { return e.name == name; });
    return it == entities.end() ? nullptr : &*it;
}

auto ResolvedSchema::find_pivot(std::string_view name) const -> const Pivot* {
    auto it = std::find_if(pivots.begin(), pivots.end(),
                           [&](const Pivot& p) { return p.name == name; });
    return it == pivots.end() ? nullptr : &*it;
}

} // namespace schemly::schema
