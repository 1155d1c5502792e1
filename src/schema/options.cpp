//! # Global Options Implementation

#include "schema/options.hpp"

#include "log/log.hpp"
#include "schema/naming.hpp"

#include <cstdlib>
#include <optional>

namespace schemly::schema {

namespace {

constexpr std::string_view DATABASE_ENGINES[] = {"mysql", "pgsql", "sqlite", "sqlsrv"};

auto read_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

auto parse_env_bool(const std::string& text) -> std::optional<bool> {
    std::string lower = to_lower(text);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

void override_bool(const char* name, bool& target) {
    auto value = read_env(name);
    if (!value) {
        return;
    }
    if (auto parsed = parse_env_bool(*value)) {
        target = *parsed;
        SCHEMLY_LOG_DEBUG("config", name << " overrides option to " << (*parsed ? "true" : "false"));
    } else {
        SCHEMLY_LOG_WARN("config", "Ignoring " << name << "='" << *value << "': not a boolean");
    }
}

/// `App\Models` -> every `\`-separated part must be an identifier.
auto is_valid_namespace(const std::string& ns) -> bool {
    if (ns.empty()) {
        return false;
    }
    size_t start = 0;
    while (true) {
        auto sep = ns.find('\\', start);
        auto part = std::string_view(ns).substr(start, sep == std::string::npos ? sep : sep - start);
        if (!is_valid_identifier(part)) {
            return false;
        }
        if (sep == std::string::npos) {
            return true;
        }
        start = sep + 1;
    }
}

} // namespace

auto resolve_options(const RawOptions& raw) -> Result<GlobalOptions, ErrorList> {
    GlobalOptions options;
    options.output_dir = raw.output_dir.value_or(options.output_dir);
    options.namespace_name = raw.namespace_name.value_or(options.namespace_name);
    options.generate_models = raw.generate_models.value_or(options.generate_models);
    options.generate_controllers = raw.generate_controllers.value_or(options.generate_controllers);
    options.generate_resources = raw.generate_resources.value_or(options.generate_resources);
    options.generate_factories = raw.generate_factories.value_or(options.generate_factories);
    options.generate_migrations = raw.generate_migrations.value_or(options.generate_migrations);
    options.generate_pivot_tables =
        raw.generate_pivot_tables.value_or(options.generate_pivot_tables);
    options.generate_validation_rules =
        raw.generate_validation_rules.value_or(options.generate_validation_rules);
    options.generate_dto = raw.generate_dto.value_or(options.generate_dto);
    options.use_ddd_structure = raw.use_ddd_structure.value_or(options.use_ddd_structure);
    options.database_engine = to_lower(raw.database_engine.value_or(options.database_engine));
    options.force_overwrite = raw.force_overwrite.value_or(options.force_overwrite);

    auto errors = validate_options(options);
    if (!errors.empty()) {
        return errors;
    }
    return options;
}

void apply_env_overrides(GlobalOptions& options) {
    if (auto dir = read_env("SCHEMLY_OUTPUT_DIR")) {
        SCHEMLY_LOG_DEBUG("config", "SCHEMLY_OUTPUT_DIR overrides output dir to " << *dir);
        options.output_dir = *dir;
    }
    if (auto ns = read_env("SCHEMLY_NAMESPACE")) {
        SCHEMLY_LOG_DEBUG("config", "SCHEMLY_NAMESPACE overrides namespace to " << *ns);
        options.namespace_name = *ns;
    }
    override_bool("SCHEMLY_USE_DDD", options.use_ddd_structure);
    override_bool("SCHEMLY_FORCE_OVERWRITE", options.force_overwrite);
}

auto validate_options(const GlobalOptions& options) -> ErrorList {
    ErrorList errors;
    if (options.output_dir.empty()) {
        errors.push_back(make_error(ErrorKind::InvalidOption, "output directory must not be empty"));
    }
    if (!is_valid_namespace(options.namespace_name)) {
        errors.push_back(make_error(ErrorKind::InvalidOption,
                                    "namespace '" + options.namespace_name +
                                        "' is not a valid namespace path"));
    }
    bool known_engine = false;
    for (auto engine : DATABASE_ENGINES) {
        if (options.database_engine == engine) {
            known_engine = true;
        }
    }
    if (!known_engine) {
        auto err = make_error(ErrorKind::InvalidOption,
                              "unsupported database engine '" + options.database_engine + "'");
        err.notes.push_back("supported engines: mysql, pgsql, sqlite, sqlsrv");
        errors.push_back(std::move(err));
    }
    return errors;
}

} // namespace schemly::schema
