//! # Resolver Driver
//!
//! ```text
//! schemly-resolve [options] <schema.yaml>
//!   ├─ --help, -h       → print_usage()
//!   ├─ --version, -V    → print_version()
//!   ├─ --json           → resolved schema / error report as JSON on stdout
//!   ├─ --compact        → single-line JSON
//!   ├─ --no-env         → ignore SCHEMLY_* option overrides
//!   └─ log options      → --log-level=, --log-filter=, --log-file=,
//!                         --log-format=, -v/-vv/-vvv, -q
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Schema resolved |
//! | 1 | Schema has errors |
//! | 2 | Usage error or unreadable input |

#include "cli/driver.hpp"

#include "common.hpp"
#include "log/log.hpp"
#include "schema/export.hpp"
#include "schema/resolver.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace schemly::cli {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_SCHEMA_ERRORS = 1;
constexpr int EXIT_USAGE = 2;

void print_usage() {
    std::cout << "schemly-resolve " << VERSION << "\n"
              << "Resolve a schemly schema document into an emission plan.\n\n"
              << "Usage: schemly-resolve [options] <schema.yaml>\n\n"
              << "Options:\n"
              << "  --json               Print the resolved schema (or errors) as JSON\n"
              << "  --compact            Print JSON on a single line\n"
              << "  --no-env             Ignore SCHEMLY_* environment overrides\n"
              << "  -h, --help           Show this help\n"
              << "  -V, --version        Show the version\n\n"
              << "Logging:\n"
              << "  --log-level=LEVEL    trace, debug, info, warn, error, off\n"
              << "  --log-filter=SPEC    Per-module levels, e.g. relation=trace,*=warn\n"
              << "  --log-file=PATH      Also write log records to PATH\n"
              << "  --log-format=FORMAT  text or json\n"
              << "  -v, -vv, -vvv        Info, debug, trace\n"
              << "  -q, --quiet          Errors only\n";
}

void print_version() {
    std::cout << "schemly-resolve " << VERSION << "\n";
}

void print_plan(const schema::ResolvedSchema& resolved) {
    for (const auto& step : resolved.emission_order) {
        if (step.kind == schema::EmissionStep::Kind::Entity) {
            const auto* entity = resolved.find_entity(step.name);
            std::cout << "entity " << step.name << " (" << entity->table << ")\n";
        } else {
            std::cout << "pivot  " << step.name << "\n";
        }
    }
    std::cout << resolved.entities.size() << " entities, " << resolved.pivots.size()
              << " pivots\n";
}

} // namespace

} // namespace schemly::cli

int schemly_main(int argc, char* argv[]) {
    using namespace schemly;

    bool as_json = false;
    bool compact = false;
    schema::ResolveSettings settings;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli::print_usage();
            return cli::EXIT_OK;
        }
        if (arg == "--version" || arg == "-V") {
            cli::print_version();
            return cli::EXIT_OK;
        }
        if (arg == "--json") {
            as_json = true;
        } else if (arg == "--compact") {
            compact = true;
        } else if (arg == "--no-env") {
            settings.use_environment = false;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "error: unknown option '" << arg << "'\n";
            std::cerr << "Run 'schemly-resolve --help' for usage information.\n";
            return cli::EXIT_USAGE;
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.size() != 1) {
        std::cerr << "Usage: schemly-resolve [options] <schema.yaml>\n";
        return cli::EXIT_USAGE;
    }

    log::Logger::init(log::parse_log_options(argc, argv));

    if (!std::ifstream(inputs.front())) {
        std::cerr << "error: cannot open '" << inputs.front() << "'\n";
        return cli::EXIT_USAGE;
    }
    SCHEMLY_LOG_DEBUG("driver", "resolving " << inputs.front());

    schema::SchemaResolver resolver(settings);
    auto result = resolver.resolve_file(inputs.front());

    auto print_json = [&](const json::JsonValue& value) {
        std::cout << (compact ? value.to_string() : value.to_string_pretty()) << "\n";
    };

    if (is_err(result)) {
        const auto& errors = unwrap_err(result);
        if (as_json) {
            print_json(schema::errors_to_json(errors));
        } else {
            std::cerr << schema::format_errors(errors);
        }
        log::Logger::instance().flush();
        return cli::EXIT_SCHEMA_ERRORS;
    }

    if (as_json) {
        print_json(schema::to_json(unwrap(result)));
    } else {
        cli::print_plan(unwrap(result));
    }
    log::Logger::instance().flush();
    return cli::EXIT_OK;
}
