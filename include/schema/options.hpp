//! # Global Options
//!
//! Generator options with their defaults applied. Options do not influence
//! resolution itself; they are validated and carried in the Resolved Schema
//! for the emitters.
//!
//! | Key | Default | Environment override |
//! |-----|---------|----------------------|
//! | `outputDir` | `.` | `SCHEMLY_OUTPUT_DIR` |
//! | `namespace` | `App\Models` | `SCHEMLY_NAMESPACE` |
//! | `generate*` | `true` (`generateDto`: `false`) | - |
//! | `useDddStructure` | `false` | `SCHEMLY_USE_DDD` |
//! | `databaseEngine` | `mysql` | - |
//! | `forceOverwrite` | `false` | `SCHEMLY_FORCE_OVERWRITE` |

#ifndef SCHEMLY_SCHEMA_OPTIONS_HPP
#define SCHEMLY_SCHEMA_OPTIONS_HPP

#include "common.hpp"
#include "schema/config.hpp"
#include "schema/error.hpp"

#include <string>

namespace schemly::schema {

struct GlobalOptions {
    std::string output_dir = ".";
    std::string namespace_name = "App\\Models";
    bool generate_models = true;
    bool generate_controllers = true;
    bool generate_resources = true;
    bool generate_factories = true;
    bool generate_migrations = true;
    bool generate_pivot_tables = true;
    bool generate_validation_rules = true;
    bool generate_dto = false;
    bool use_ddd_structure = false;
    std::string database_engine = "mysql";
    bool force_overwrite = false;

    auto operator==(const GlobalOptions& other) const -> bool = default;
};

/// Applies defaults to `raw` and validates the result. Fails with
/// `InvalidOption` errors.
[[nodiscard]] auto resolve_options(const RawOptions& raw) -> Result<GlobalOptions, ErrorList>;

/// Overrides options from `SCHEMLY_*` environment variables. Boolean
/// variables accept `1/0`, `true/false`, `yes/no` and `on/off`; anything else
/// is ignored with a warning.
void apply_env_overrides(GlobalOptions& options);

/// Checks resolved options (used again after environment overrides).
[[nodiscard]] auto validate_options(const GlobalOptions& options) -> ErrorList;

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_OPTIONS_HPP
