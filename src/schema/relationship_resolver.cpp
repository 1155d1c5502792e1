//! # Relationship Resolver Implementation

#include "schema/relationship_resolver.hpp"

#include "log/log.hpp"
#include "schema/naming.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace schemly::schema {

// ============================================================================
// Schema Index
// ============================================================================

auto table_of(const RawEntity& entity) -> std::string {
    return entity.table ? *entity.table : table_name_for(entity.name);
}

auto primary_key_of(const RawEntity& entity) -> std::string {
    for (const auto& field : entity.fields) {
        if (field.primary.value_or(false)) {
            return field.name;
        }
    }
    return "id";
}

SchemaIndex::SchemaIndex(const RawSchema& schema) {
    entities_.reserve(schema.entities.size());
    for (size_t i = 0; i < schema.entities.size(); ++i) {
        const auto& raw = schema.entities[i];
        if (by_name_.count(raw.name) != 0) {
            continue;
        }
        EntityInfo info;
        info.name = raw.name;
        info.table = table_of(raw);
        info.primary_key = primary_key_of(raw);
        info.position = i;
        for (const auto& rel : raw.relationships) {
            if (parse_relation_type(rel.kind) == RelationType::MorphTo && rel.morph_name) {
                info.morph_names.push_back(*rel.morph_name);
            }
        }
        by_name_.emplace(raw.name, entities_.size());
        entities_.push_back(std::move(info));
    }
}

auto SchemaIndex::find(std::string_view name) const -> const EntityInfo* {
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : &entities_[it->second];
}

auto SchemaIndex::declares_morph(std::string_view entity, std::string_view morph) const -> bool {
    const EntityInfo* info = find(entity);
    if (info == nullptr) {
        return false;
    }
    return std::find(info->morph_names.begin(), info->morph_names.end(), morph) !=
           info->morph_names.end();
}

auto relationship_label(const RawRelationship& raw) -> std::string {
    if (raw.name) {
        return *raw.name;
    }
    if (raw.target) {
        return raw.kind + " " + *raw.target;
    }
    return raw.kind;
}

// ============================================================================
// Relationship Resolver
// ============================================================================

namespace {

struct CascadePair {
    CascadePolicy on_delete = CascadePolicy::Restrict;
    CascadePolicy on_update = CascadePolicy::Restrict;
};

auto parse_cascade(const std::optional<std::string>& spelling, const char* key,
                   const ErrorLocation& where) -> Result<CascadePolicy, SchemaError> {
    if (!spelling) {
        return CascadePolicy::Restrict;
    }
    auto policy = parse_cascade_policy(*spelling);
    if (!policy) {
        auto err = make_error(ErrorKind::MalformedInput,
                              std::string("invalid ") + key + " policy '" + *spelling + "'", where);
        err.notes.push_back("expected one of: cascade, restrict, set-null, none");
        return err;
    }
    return *policy;
}

auto read_cascades(const RawRelationship& raw, RelationType type, const ErrorLocation& where)
    -> Result<CascadePair, SchemaError> {
    CascadePair pair;
    if (!accepts_cascade(type)) {
        if (raw.on_delete || raw.on_update) {
            SCHEMLY_LOG_WARN("relation", where.entity << "." << where.relationship
                                                      << ": ignoring cascade policy on "
                                                      << relation_type_name(type));
        }
        return pair;
    }
    auto on_delete = parse_cascade(raw.on_delete, "onDelete", where);
    if (is_err(on_delete)) {
        return unwrap_err(on_delete);
    }
    auto on_update = parse_cascade(raw.on_update, "onUpdate", where);
    if (is_err(on_update)) {
        return unwrap_err(on_update);
    }
    pair.on_delete = unwrap(on_delete);
    pair.on_update = unwrap(on_update);
    return pair;
}

auto default_method_name(RelationType type, const std::string& target) -> std::string {
    return is_to_many(type) ? camel_case(pluralize(target)) : camel_case(target);
}

auto missing_morph_name(RelationType type, const ErrorLocation& where) -> SchemaError {
    auto err = make_error(ErrorKind::UnmatchedMorphName,
                          std::string(relation_type_name(type)) + " requires a morph name", where);
    err.notes.push_back("add `morphName: <name>`");
    return err;
}

} // namespace

RelationshipResolver::RelationshipResolver(const SchemaIndex& index, PivotRegistry& registry)
    : index_(index), registry_(registry) {}

auto RelationshipResolver::lookup_target(const RawRelationship& raw, const ErrorLocation& where)
    -> Result<const EntityInfo*, SchemaError> {
    if (!raw.target || raw.target->empty()) {
        return make_error(ErrorKind::UnknownTargetEntity,
                          raw.kind + " relationship has no target entity", where);
    }
    const EntityInfo* target = index_.find(*raw.target);
    if (target == nullptr) {
        return make_error(ErrorKind::UnknownTargetEntity,
                          "unknown target entity '" + *raw.target + "'", where);
    }
    return target;
}

auto RelationshipResolver::resolve(const RawRelationship& raw, const RawEntity& owner, size_t index)
    -> Result<ResolvedRelationship, SchemaError> {
    ErrorLocation where;
    where.entity = owner.name;
    where.relationship = relationship_label(raw);
    where.mark = raw.mark;

    auto type = parse_relation_type(raw.kind);
    if (!type) {
        auto err = make_error(ErrorKind::UnknownRelationshipKind,
                              "unknown relationship kind '" + raw.kind + "'", where);
        err.notes.push_back("expected one of: belongsTo, hasOne, hasMany, belongsToMany, morphTo, "
                            "morphOne, morphMany, morphToMany");
        return err;
    }

    auto cascades = read_cascades(raw, *type, where);
    if (is_err(cascades)) {
        return unwrap_err(cascades);
    }
    CascadePair cascade = unwrap(cascades);

    const EntityInfo* self = index_.find(owner.name);
    std::string owner_pk = self != nullptr ? self->primary_key : primary_key_of(owner);
    std::string owner_table = self != nullptr ? self->table : table_of(owner);

    ResolvedRelationship out;
    out.relationship.mark = raw.mark;

    if (*type == RelationType::MorphTo) {
        if (!raw.morph_name || raw.morph_name->empty()) {
            return missing_morph_name(*type, where);
        }
        const std::string& morph = *raw.morph_name;
        out.relationship.method_name = raw.name.value_or(morph);
        out.relationship.kind = MorphTo{morph, morph + "_type", morph + "_id"};
        SCHEMLY_LOG_DEBUG("relation", owner.name << "." << out.relationship.method_name
                                                 << ": morphTo '" << morph << "'");
        return out;
    }

    auto found = lookup_target(raw, where);
    if (is_err(found)) {
        return unwrap_err(found);
    }
    const EntityInfo& target = *unwrap(found);
    out.relationship.method_name = raw.name.value_or(default_method_name(*type, target.name));

    switch (*type) {
    case RelationType::BelongsTo: {
        BelongsTo rel;
        rel.target = target.name;
        rel.foreign_key = raw.foreign_key.value_or(foreign_key_for(target.name));
        rel.owner_key = raw.owner_key.value_or(target.primary_key);
        rel.on_delete = cascade.on_delete;
        rel.on_update = cascade.on_update;
        out.relationship.kind = std::move(rel);
        break;
    }
    case RelationType::HasOne: {
        HasOne rel;
        rel.target = target.name;
        rel.foreign_key = raw.foreign_key.value_or(foreign_key_for(owner.name));
        rel.local_key = raw.local_key.value_or(owner_pk);
        rel.on_delete = cascade.on_delete;
        rel.on_update = cascade.on_update;
        out.relationship.kind = std::move(rel);
        break;
    }
    case RelationType::HasMany: {
        HasMany rel;
        rel.target = target.name;
        rel.foreign_key = raw.foreign_key.value_or(foreign_key_for(owner.name));
        rel.local_key = raw.local_key.value_or(owner_pk);
        rel.on_delete = cascade.on_delete;
        rel.on_update = cascade.on_update;
        out.relationship.kind = std::move(rel);
        break;
    }
    case RelationType::BelongsToMany: {
        PivotClaim claim;
        if (raw.pivot_table) {
            claim.pivot_name = *raw.pivot_table;
        } else {
            // A pivot declared for this pair takes the place of the derived one
            auto declared = registry_.declared_between(owner.name, target.name);
            if (declared.size() > 1) {
                auto err = make_error(ErrorKind::PivotKeyConflict,
                                      "'" + owner.name + "' and '" + target.name + "' have " +
                                          std::to_string(declared.size()) + " declared pivots",
                                      where);
                for (const auto& name : declared) {
                    err.notes.push_back("declared pivot '" + name + "'");
                }
                err.notes.push_back("pick one with `pivotTable: <name>`");
                return err;
            }
            claim.pivot_name = declared.empty() ? pivot_name_for(owner_table, target.table)
                                                : declared.front();
        }
        claim.owner = owner.name;
        claim.owner_table = owner_table;
        claim.target = target.name;
        claim.target_table = target.table;
        claim.owner_key = raw.foreign_pivot_key ? raw.foreign_pivot_key : raw.foreign_key;
        claim.target_key = raw.related_pivot_key;
        claim.with_timestamps = raw.with_timestamps.value_or(false);
        claim.pivot_fields = raw.pivot_fields;
        claim.where = where;

        BelongsToMany rel;
        rel.target = target.name;
        rel.pivot = claim.pivot_name;
        rel.parent_key = raw.local_key.value_or(owner_pk);
        rel.related_key = raw.owner_key.value_or(target.primary_key);
        rel.with_timestamps = claim.with_timestamps;
        rel.pivot_fields = raw.pivot_fields;
        rel.on_delete = cascade.on_delete;
        rel.on_update = cascade.on_update;
        out.relationship.kind = std::move(rel);
        out.claim = registry_.claim(std::move(claim));
        break;
    }
    case RelationType::MorphOne:
    case RelationType::MorphMany: {
        if (!raw.morph_name || raw.morph_name->empty()) {
            return missing_morph_name(*type, where);
        }
        const std::string& morph = *raw.morph_name;
        if (!index_.declares_morph(target.name, morph)) {
            auto err = make_error(ErrorKind::UnmatchedMorphName,
                                  "'" + target.name + "' has no morphTo named '" + morph + "'",
                                  where);
            err.notes.push_back("declare `{ type: morphTo, morphName: " + morph + " }` on '" +
                                target.name + "'");
            return err;
        }
        std::string local_key = raw.local_key.value_or(owner_pk);
        if (*type == RelationType::MorphOne) {
            out.relationship.kind = MorphOne{target.name, morph, local_key};
        } else {
            out.relationship.kind = MorphMany{target.name, morph, local_key};
        }
        break;
    }
    case RelationType::MorphToMany: {
        if (!raw.morph_name || raw.morph_name->empty()) {
            return missing_morph_name(*type, where);
        }
        const std::string& morph = *raw.morph_name;

        MorphPivotClaim claim;
        claim.pivot_name = raw.pivot_table.value_or(pluralize(morph));
        claim.owner = owner.name;
        claim.target = target.name;
        claim.morph_name = morph;
        claim.morph_key = raw.foreign_pivot_key ? raw.foreign_pivot_key : raw.foreign_key;
        claim.target_key = raw.related_pivot_key;
        claim.with_timestamps = raw.with_timestamps.value_or(false);
        claim.pivot_fields = raw.pivot_fields;
        claim.where = where;

        MorphToMany rel;
        rel.target = target.name;
        rel.morph_name = morph;
        rel.pivot = claim.pivot_name;
        rel.morph_type_column = morph + "_type";
        rel.with_timestamps = claim.with_timestamps;
        out.relationship.kind = std::move(rel);
        out.claim = registry_.claim_morph(std::move(claim));
        break;
    }
    case RelationType::MorphTo:
        break;
    }

    SCHEMLY_LOG_DEBUG("relation", owner.name << "." << out.relationship.method_name << " #"
                                             << index << ": " << relation_type_name(*type)
                                             << " -> " << target.name);
    return out;
}

void RelationshipResolver::apply_pivot_keys(Relationship& relationship, const PivotKeys& keys) {
    if (auto* rel = std::get_if<BelongsToMany>(&relationship.kind)) {
        rel->foreign_pivot_key = keys.foreign;
        rel->related_pivot_key = keys.related;
    } else if (auto* rel = std::get_if<MorphToMany>(&relationship.kind)) {
        rel->foreign_pivot_key = keys.foreign;
        rel->related_pivot_key = keys.related;
    }
}

} // namespace schemly::schema
