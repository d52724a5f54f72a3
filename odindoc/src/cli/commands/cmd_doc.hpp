//! # Documentation Command
//!
//! Parses the command line and produces the package or symbol report.
//!
//! ## Usage
//!
//! ```bash
//! odindoc <package-or-path>          # whole package
//! odindoc <package>.<symbol>         # one declaration
//! odindoc --root                     # show the resolved Odin root
//! ```
//!
//! ## Options
//!
//! - `--root`, `-r`: Print the resolved Odin root and whether `core` exists
//! - `--include-private`, `-u`: Include private declarations in package reports
//! - `--version`, `-v`: Print the version
//! - `--help`, `-h`: Print usage

#ifndef ODINDOC_CLI_CMD_DOC_HPP
#define ODINDOC_CLI_CMD_DOC_HPP

#include "toolchain/root.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace odindoc::cli {

/// What the invocation asks for.
enum class DocMode {
    Help,    ///< Print usage.
    Version, ///< Print the version string.
    Root,    ///< Print the root diagnostic.
    Package, ///< Document a whole package.
    Symbol,  ///< Document one symbol.
};

/// The positional argument split into package and optional symbol.
struct DocTarget {
    std::string package_ref;           ///< Directory or `core:name` reference.
    std::optional<std::string> symbol; ///< Symbol name in `<package>.<symbol>` form.
};

/// Options for the doc command.
struct DocOptions {
    DocMode mode = DocMode::Help;
    DocTarget target;
    bool include_private = false; ///< Keep private declarations in package reports.
};

/// Splits `<package>.<symbol>`.
///
/// Symbol form requires exactly one `.`, a non-empty package part and an
/// identifier after the dot. Existing directories and every other form are
/// treated as a whole package.
[[nodiscard]] auto parse_target(const std::string& arg) -> DocTarget;

/// Parses command-line arguments. Logging options are skipped here; they are
/// handled by `log::parse_log_options()`.
[[nodiscard]] auto parse_doc_args(int argc, char* argv[]) -> DocOptions;

/// Runs the doc command, writing the report to `out`.
///
/// @param search Inputs for root resolution; consulted only when needed.
/// @returns 0; every reportable condition is printed, not signalled.
int run_doc(const DocOptions& options, const toolchain::RootSearchConfig& search,
            std::ostream& out);

/// Prints the root diagnostic for `--root`.
int run_root(const toolchain::RootResult& root, std::ostream& out);

/// Prints help for the doc command.
void print_doc_help(std::ostream& out);

} // namespace odindoc::cli

#endif // ODINDOC_CLI_CMD_DOC_HPP
