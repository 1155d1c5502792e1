//! # schemly-resolve Entry Point
//!
//! Delegates to the CLI driver.
//!
//! ```bash
//! schemly-resolve schema.yaml            # print the emission order
//! schemly-resolve --json schema.yaml     # print the resolved schema as JSON
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return schemly_main(argc, argv);
}
