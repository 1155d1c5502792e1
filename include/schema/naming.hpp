//! # Naming Conventions
//!
//! Stateless string helpers that derive every implicit name in a schema:
//! table names, foreign keys, pivot names and relationship method names.
//!
//! | Input | `snake_case` | `camel_case` | `pascal_case` | `pluralize` |
//! |-------|--------------|--------------|---------------|-------------|
//! | `BlogPost` | `blog_post` | `blogPost` | `BlogPost` | `BlogPosts` |
//! | `Category` | `category` | `category` | `Category` | `Categories` |
//! | `HTTPServer` | `http_server` | `httpServer` | `HttpServer` | `HTTPServers` |
//!
//! Inflection follows simple English suffix rules plus a small table of
//! irregular and uncountable words. The case of the first letter is kept.

#ifndef SCHEMLY_SCHEMA_NAMING_HPP
#define SCHEMLY_SCHEMA_NAMING_HPP

#include <string>
#include <string_view>

namespace schemly::schema {

// ============================================================================
// Case Conversion
// ============================================================================

/// `BlogPost` -> `blog_post`. Dashes and spaces become underscores.
[[nodiscard]] auto snake_case(std::string_view input) -> std::string;

/// `blog_post` -> `blogPost`.
[[nodiscard]] auto camel_case(std::string_view input) -> std::string;

/// `blog_post` -> `BlogPost`.
[[nodiscard]] auto pascal_case(std::string_view input) -> std::string;

/// `BlogPost` -> `blog-post`.
[[nodiscard]] auto kebab_case(std::string_view input) -> std::string;

// ============================================================================
// Inflection
// ============================================================================

[[nodiscard]] auto pluralize(std::string_view word) -> std::string;

[[nodiscard]] auto singularize(std::string_view word) -> std::string;

/// Snake case with the last underscore-separated segment singularized:
/// `BlogPosts` -> `blog_post`.
[[nodiscard]] auto singular_snake_case(std::string_view name) -> std::string;

// ============================================================================
// Derived Names
// ============================================================================

/// Storage name for an entity: `pluralize(snake_case(name))`.
[[nodiscard]] auto table_name_for(std::string_view entity_name) -> std::string;

/// `{singular_snake_case(name)}_id`.
[[nodiscard]] auto foreign_key_for(std::string_view entity_name) -> std::string;

/// Implicit pivot name: the two storage names, sorted, joined by `_`.
[[nodiscard]] auto pivot_name_for(std::string_view table_a, std::string_view table_b)
    -> std::string;

// ============================================================================
// Identifier Checks
// ============================================================================

/// Letter or `_` first, then letters, digits or `_`; at most 64 characters.
[[nodiscard]] auto is_valid_identifier(std::string_view name) -> bool;

/// `[A-Za-z0-9_]{1,128}`.
[[nodiscard]] auto is_valid_table_name(std::string_view name) -> bool;

/// True for keywords and reserved type names of the emitted language (PHP),
/// compared case-insensitively.
[[nodiscard]] auto is_reserved_word(std::string_view name) -> bool;

/// ASCII lowercase copy.
[[nodiscard]] auto to_lower(std::string_view input) -> std::string;

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_NAMING_HPP
