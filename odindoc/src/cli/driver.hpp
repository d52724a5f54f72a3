//! # odindoc Driver Interface
//!
//! `odindoc_main()` configures logging and dispatches on the parsed options.

#pragma once

// Main entry point: parses argv, runs the requested mode, returns the exit code.
int odindoc_main(int argc, char* argv[]);
