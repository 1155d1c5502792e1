//! # Raw Schema Declarations
//!
//! Typed mirror of the input document before any inference. Every optional
//! key stays `std::optional` so later stages can tell "absent" from
//! "explicitly set to the default". Each declaration keeps the source mark
//! of the node it was read from.

#ifndef SCHEMLY_SCHEMA_CONFIG_HPP
#define SCHEMLY_SCHEMA_CONFIG_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace schemly::schema {

/// A named rule with positional parameters (`max: [50]`), passed through to
/// emitters untouched.
struct ValidationRule {
    std::string rule;
    std::vector<std::string> parameters;

    auto operator==(const ValidationRule& other) const -> bool = default;
};

/// Mass-assignment policy of an entity.
struct MassAssignment {
    enum class Mode { All, Fillable, Guarded };

    Mode mode = Mode::All;
    std::vector<std::string> columns;

    auto operator==(const MassAssignment& other) const -> bool = default;
};

struct RawEnumValue {
    std::string value;
    std::optional<std::string> label;
};

struct RawField {
    std::string name;
    std::string type;
    std::optional<bool> nullable;
    std::optional<bool> unique;
    std::optional<bool> index;
    std::optional<bool> is_unsigned;
    std::optional<bool> auto_increment;
    std::optional<bool> primary;
    std::optional<int64_t> length;
    std::optional<int64_t> precision;
    std::optional<int64_t> scale;
    std::optional<std::string> default_value;
    std::optional<std::string> comment;
    std::optional<std::vector<RawEnumValue>> enum_values;
    std::optional<std::string> cast_type;
    std::vector<ValidationRule> validation_rules;
    SourceMark mark;
};

struct RawRelationship {
    std::string kind;
    std::optional<std::string> target;
    std::optional<std::string> name;
    std::optional<std::string> foreign_key;
    std::optional<std::string> local_key;
    std::optional<std::string> owner_key;
    std::optional<std::string> pivot_table;
    std::optional<std::string> foreign_pivot_key;
    std::optional<std::string> related_pivot_key;
    std::vector<std::string> pivot_fields;
    std::optional<bool> with_timestamps;
    std::optional<std::string> morph_name;
    std::optional<std::string> on_delete;
    std::optional<std::string> on_update;
    SourceMark mark;
};

struct RawPivot {
    std::string name;
    std::string first;
    std::string second;
    std::optional<std::string> first_key;
    std::optional<std::string> second_key;
    std::optional<bool> timestamps;
    std::vector<RawField> additional_fields;
    SourceMark mark;
};

struct RawEntity {
    std::string name;
    std::optional<std::string> table;
    std::vector<RawField> fields;
    std::vector<RawRelationship> relationships;
    std::optional<bool> timestamps;
    std::optional<bool> soft_deletes;
    std::vector<std::string> traits;
    std::vector<RawPivot> pivots;
    MassAssignment mass_assignment;
    std::vector<ValidationRule> validation_rules;
    SourceMark mark;
};

/// Top-level generator options exactly as written in the document.
struct RawOptions {
    std::optional<std::string> output_dir;
    std::optional<std::string> namespace_name;
    std::optional<bool> generate_models;
    std::optional<bool> generate_controllers;
    std::optional<bool> generate_resources;
    std::optional<bool> generate_factories;
    std::optional<bool> generate_migrations;
    std::optional<bool> generate_pivot_tables;
    std::optional<bool> generate_validation_rules;
    std::optional<bool> generate_dto;
    std::optional<bool> use_ddd_structure;
    std::optional<std::string> database_engine;
    std::optional<bool> force_overwrite;
};

struct RawSchema {
    RawOptions options;
    std::vector<RawEntity> entities;
    std::vector<RawPivot> pivots;
    /// Name of the document (file path or `<string>`), used in log messages.
    std::string source_name;
};

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_CONFIG_HPP
