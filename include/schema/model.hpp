//! # Resolved Schema Model
//!
//! The fully-resolved, immutable representation handed to emitters. Every
//! implicit name is filled in: tables, foreign and local keys, pivot names
//! and key pairs, morph columns and relationship method names.
//!
//! ## Relationships
//!
//! `Relationship::kind` is a closed `std::variant` with one alternative per
//! relationship kind. Each alternative carries only the attributes that are
//! meaningful to it:
//!
//! ```cpp
//! if (rel.is<BelongsTo>()) {
//!     const auto& belongs = rel.as<BelongsTo>();
//!     emit_foreign_key(belongs.foreign_key, belongs.target, belongs.owner_key);
//! }
//! ```

#ifndef SCHEMLY_SCHEMA_MODEL_HPP
#define SCHEMLY_SCHEMA_MODEL_HPP

#include "common.hpp"
#include "schema/config.hpp"
#include "schema/options.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace schemly::schema {

// ============================================================================
// Field Types
// ============================================================================

/// Closed set of logical column types.
enum class FieldType {
    String,
    Text,
    MediumText,
    LongText,
    TinyInteger,
    SmallInteger,
    MediumInteger,
    Integer,
    BigInteger,
    Float,
    Decimal,
    Boolean,
    Date,
    DateTime,
    Timestamp,
    Time,
    Json,
    Uuid,
    Enum,
    Binary,
    IpAddress,
};

/// Classifies a type spelling, case-insensitive and ignoring `_`
/// (`bigInteger`, `big_integer`, `BIGINT` are all `BigInteger`).
[[nodiscard]] auto parse_field_type(std::string_view spelling) -> std::optional<FieldType>;

/// Canonical spelling, e.g. `bigInteger`.
[[nodiscard]] auto field_type_name(FieldType type) -> const char*;

/// Cast derived from the type (`integer`, `float`, `boolean`, `array`,
/// `date`, `datetime`), or `nullopt` for types stored as strings.
[[nodiscard]] auto default_cast(FieldType type) -> std::optional<std::string>;

[[nodiscard]] auto is_integer_type(FieldType type) -> bool;

/// Types that accept a `length`.
[[nodiscard]] auto is_string_type(FieldType type) -> bool;

// ============================================================================
// Fields
// ============================================================================

struct EnumValue {
    std::string value;
    std::string label;

    auto operator==(const EnumValue& other) const -> bool = default;
};

struct DecimalSpec {
    uint32_t precision = 0;
    uint32_t scale = 0;

    auto operator==(const DecimalSpec& other) const -> bool = default;
};

/// Default length of `String` columns.
constexpr uint32_t DEFAULT_STRING_LENGTH = 255;

struct Field {
    std::string name;
    FieldType type = FieldType::String;
    bool nullable = false;
    bool unique = false;
    bool indexed = false;
    bool is_unsigned = false;
    bool auto_increment = false;
    bool primary = false;
    std::optional<uint32_t> length;
    std::optional<DecimalSpec> decimal;
    std::vector<EnumValue> enum_values;
    std::optional<std::string> default_value;
    std::optional<std::string> comment;
    std::optional<std::string> cast;
    std::vector<ValidationRule> validation_rules;
    SourceMark mark;

    auto operator==(const Field& other) const -> bool = default;
};

// ============================================================================
// Relationships
// ============================================================================

/// Referential action on delete/update.
enum class CascadePolicy {
    Cascade,
    Restrict,
    SetNull,
    None,
};

/// Accepts `cascade`, `restrict`, `set-null` (`set null`, `setNull`,
/// `set_null`) and `none` (`no action`), case-insensitive.
[[nodiscard]] auto parse_cascade_policy(std::string_view spelling) -> std::optional<CascadePolicy>;

/// `cascade`, `restrict`, `set-null` or `none`.
[[nodiscard]] auto cascade_policy_name(CascadePolicy policy) -> const char*;

/// Relationship kind without its payload, used for classification.
enum class RelationType {
    BelongsTo,
    HasOne,
    HasMany,
    BelongsToMany,
    MorphTo,
    MorphOne,
    MorphMany,
    MorphToMany,
};

/// Classifies a kind spelling, case-insensitive and ignoring `_` and `-`.
[[nodiscard]] auto parse_relation_type(std::string_view spelling) -> std::optional<RelationType>;

/// Input spelling, e.g. `belongsToMany`.
[[nodiscard]] auto relation_type_name(RelationType type) -> const char*;

/// Kinds whose method name is derived from the pluralized target.
[[nodiscard]] auto is_to_many(RelationType type) -> bool;

/// Kinds that accept `onDelete` / `onUpdate`.
[[nodiscard]] auto accepts_cascade(RelationType type) -> bool;

/// The owner holds `foreign_key`, pointing at `owner_key` on the target.
struct BelongsTo {
    std::string target;
    std::string foreign_key;
    std::string owner_key;
    CascadePolicy on_delete = CascadePolicy::Restrict;
    CascadePolicy on_update = CascadePolicy::Restrict;

    auto operator==(const BelongsTo& other) const -> bool = default;
};

/// The target holds `foreign_key`, pointing at `local_key` on the owner.
struct HasOne {
    std::string target;
    std::string foreign_key;
    std::string local_key;
    CascadePolicy on_delete = CascadePolicy::Restrict;
    CascadePolicy on_update = CascadePolicy::Restrict;

    auto operator==(const HasOne& other) const -> bool = default;
};

struct HasMany {
    std::string target;
    std::string foreign_key;
    std::string local_key;
    CascadePolicy on_delete = CascadePolicy::Restrict;
    CascadePolicy on_update = CascadePolicy::Restrict;

    auto operator==(const HasMany& other) const -> bool = default;
};

/// Many-to-many through `pivot`. `foreign_pivot_key` references the owner,
/// `related_pivot_key` the target.
struct BelongsToMany {
    std::string target;
    std::string pivot;
    std::string foreign_pivot_key;
    std::string related_pivot_key;
    std::string parent_key;
    std::string related_key;
    bool with_timestamps = false;
    std::vector<std::string> pivot_fields;
    CascadePolicy on_delete = CascadePolicy::Restrict;
    CascadePolicy on_update = CascadePolicy::Restrict;

    auto operator==(const BelongsToMany& other) const -> bool = default;
};

/// Polymorphic owner side: `{morph}_type` and `{morph}_id` on this entity.
struct MorphTo {
    std::string morph_name;
    std::string type_column;
    std::string id_column;

    auto operator==(const MorphTo& other) const -> bool = default;
};

struct MorphOne {
    std::string target;
    std::string morph_name;
    std::string local_key;

    auto operator==(const MorphOne& other) const -> bool = default;
};

struct MorphMany {
    std::string target;
    std::string morph_name;
    std::string local_key;

    auto operator==(const MorphMany& other) const -> bool = default;
};

/// Polymorphic many-to-many. The pivot holds `foreign_pivot_key`
/// (`{morph}_id`), `morph_type_column` (`{morph}_type`) and
/// `related_pivot_key`, which references the target.
struct MorphToMany {
    std::string target;
    std::string morph_name;
    std::string pivot;
    std::string foreign_pivot_key;
    std::string related_pivot_key;
    std::string morph_type_column;
    bool with_timestamps = false;

    auto operator==(const MorphToMany& other) const -> bool = default;
};

/// Alternatives are ordered like `RelationType`.
using RelationshipKind = std::variant<BelongsTo, HasOne, HasMany, BelongsToMany, MorphTo, MorphOne,
                                      MorphMany, MorphToMany>;

struct Relationship {
    std::string method_name;
    RelationshipKind kind;
    SourceMark mark;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Throws `std::bad_variant_access` on a kind mismatch.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    [[nodiscard]] auto type() const -> RelationType {
        return static_cast<RelationType>(kind.index());
    }

    /// Target entity name, or `nullptr` for `morphTo`.
    [[nodiscard]] auto target() const -> const std::string*;

    auto operator==(const Relationship& other) const -> bool = default;
};

// ============================================================================
// Entities and Pivots
// ============================================================================

struct Entity {
    std::string name;
    std::string table;
    std::string primary_key = "id";
    std::vector<Field> fields;
    std::vector<Relationship> relationships;
    bool has_timestamps = false;
    bool has_soft_deletes = false;
    std::vector<std::string> traits;
    MassAssignment mass_assignment;
    std::vector<ValidationRule> validation_rules;
    SourceMark mark;

    [[nodiscard]] auto find_field(std::string_view field_name) const -> const Field*;

    auto operator==(const Entity& other) const -> bool = default;
};

/// A join table. For a plain pivot `first_*` and `second_*` describe the two
/// related entities in canonical order. For a polymorphic pivot `first_*`
/// is the target entity and `second_key` / `morph_type_column` are the
/// `{morph}_id` / `{morph}_type` columns shared by `morph_entities`.
struct Pivot {
    std::string name;
    std::string first_entity;
    std::string first_key;
    std::string second_entity;
    std::string second_key;
    bool timestamps = false;
    std::vector<Field> fields;
    std::vector<std::string> extra_columns;
    bool declared = false;
    std::optional<std::string> morph_name;
    std::string morph_type_column;
    std::vector<std::string> morph_entities;
    SourceMark mark;

    [[nodiscard]] auto is_polymorphic() const -> bool {
        return morph_name.has_value();
    }

    /// Entities this pivot references (one for a polymorphic pivot, one for
    /// a self-referential pair, otherwise two).
    [[nodiscard]] auto referenced_entities() const -> std::vector<std::string>;

    auto operator==(const Pivot& other) const -> bool = default;
};

// ============================================================================
// Resolved Schema
// ============================================================================

/// One step of the emission sequence.
struct EmissionStep {
    enum class Kind { Entity, Pivot };

    Kind kind;
    std::string name;

    auto operator==(const EmissionStep& other) const -> bool = default;
};

struct ResolvedSchema {
    GlobalOptions options;
    /// Entities in emission order.
    std::vector<Entity> entities;
    /// Pivots in emission order.
    std::vector<Pivot> pivots;
    /// Entity and pivot steps interleaved in topological order.
    std::vector<EmissionStep> emission_order;

    [[nodiscard]] auto find_entity(std::string_view name) const -> const Entity*;
    [[nodiscard]] auto find_pivot(std::string_view name) const -> const Pivot*;

    auto operator==(const ResolvedSchema& other) const -> bool = default;
};

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_MODEL_HPP
