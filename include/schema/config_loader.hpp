//! # Document Loader
//!
//! Reads a YAML (or JSON) schema document into a `RawSchema`. Keys are
//! camelCase; the snake_case spelling of every key is accepted as well.
//!
//! The loader performs no inference. It only checks shape: required keys are
//! present, scalars are scalars, flags are booleans, sizes are non-negative
//! integers. Each malformed item is reported as `MalformedInput` with its
//! source position and skipped, so one pass reports every structural problem.
//!
//! ```cpp
//! ConfigLoader loader;
//! auto loaded = loader.load_file("schema.yaml");
//! if (is_err(loaded)) {
//!     std::cerr << format_errors(unwrap_err(loaded));
//! }
//! ```

#ifndef SCHEMLY_SCHEMA_CONFIG_LOADER_HPP
#define SCHEMLY_SCHEMA_CONFIG_LOADER_HPP

#include "common.hpp"
#include "schema/config.hpp"
#include "schema/error.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemly::schema {

class ConfigLoader {
public:
    /// Parses `text`. `source_name` only appears in log messages.
    [[nodiscard]] auto load_string(std::string_view text, std::string source_name = "<string>")
        -> Result<RawSchema, ErrorList>;

    [[nodiscard]] auto load_file(const std::string& path) -> Result<RawSchema, ErrorList>;

    /// Reads an already parsed document.
    [[nodiscard]] auto load_node(const YAML::Node& root, std::string source_name = "<node>")
        -> Result<RawSchema, ErrorList>;

private:
    ErrorList errors_;

    void malformed(std::string message, ErrorLocation where, const YAML::Node& node);

    // Declarations
    void read_options(const YAML::Node& root, RawOptions& options);
    auto read_entity(const YAML::Node& node) -> std::optional<RawEntity>;
    auto read_field(const YAML::Node& node, const ErrorLocation& where) -> std::optional<RawField>;
    auto read_relationship(const YAML::Node& node, const ErrorLocation& where)
        -> std::optional<RawRelationship>;
    auto read_pivot(const YAML::Node& node, const ErrorLocation& where) -> std::optional<RawPivot>;
    auto read_pivots(const YAML::Node& node, std::string_view key, const ErrorLocation& where)
        -> std::vector<RawPivot>;
    auto read_enum_values(const YAML::Node& node, const ErrorLocation& where)
        -> std::optional<std::vector<RawEnumValue>>;
    auto read_rules(const YAML::Node& node, const ErrorLocation& where)
        -> std::vector<ValidationRule>;

    // Scalars
    auto read_string(const YAML::Node& node, std::string_view key, const ErrorLocation& where)
        -> std::optional<std::string>;
    auto read_required(const YAML::Node& node, std::string_view key, const ErrorLocation& where)
        -> std::optional<std::string>;
    auto read_bool(const YAML::Node& node, std::string_view key, const ErrorLocation& where)
        -> std::optional<bool>;
    auto read_size(const YAML::Node& node, std::string_view key, const ErrorLocation& where)
        -> std::optional<int64_t>;
    auto read_string_list(const YAML::Node& node, std::string_view key,
                          const ErrorLocation& where) -> std::vector<std::string>;
};

/// Looks up `key`, falling back to its snake_case spelling. Returns an
/// undefined node when neither is present.
[[nodiscard]] auto lookup_key(const YAML::Node& node, std::string_view key) -> YAML::Node;

/// Converts a yaml-cpp mark (0-based, -1 when unknown) to a `SourceMark`.
[[nodiscard]] auto to_source_mark(const YAML::Mark& mark) -> SourceMark;

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_CONFIG_LOADER_HPP
