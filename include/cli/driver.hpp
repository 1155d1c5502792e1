//! # Resolver Driver Interface
//!
//! `schemly_main()` parses the command line, resolves one schema document
//! and prints either the resolved schema or the error report.

#pragma once

// Command-line entry point. Returns 0 on success, 1 when the schema has
// errors and 2 on usage errors or an unreadable input file.
int schemly_main(int argc, char* argv[]);
