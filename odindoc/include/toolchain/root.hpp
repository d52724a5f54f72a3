//! # Odin Root Resolution
//!
//! Locates the Odin installation root, the directory holding the `core`
//! library collection.
//!
//! ## Search Order
//!
//! | Step | Source                                   |
//! |------|------------------------------------------|
//! | 1    | `ODIN_ROOT` environment variable         |
//! | 2    | Fixed platform-specific directories      |
//! | 3    | Directories around `odin` found on PATH  |
//!
//! The first candidate containing a `core` subdirectory wins. The result is
//! a plain value: callers resolve once and pass it to discovery.

#ifndef ODINDOC_TOOLCHAIN_ROOT_HPP
#define ODINDOC_TOOLCHAIN_ROOT_HPP

#include <optional>
#include <string>
#include <vector>

namespace odindoc::toolchain {

/// Inputs of the root search. Tests build one by hand; the CLI uses
/// `from_environment()`.
struct RootSearchConfig {
    std::optional<std::string> env_root; ///< Value of ODIN_ROOT, if set.
    std::vector<std::string> candidates; ///< Fixed directories, tried in order.
    std::string path_var;                ///< Value of PATH.
    std::string binary_name;             ///< Compiler binary to look for on PATH.

    /// Reads ODIN_ROOT, HOME and PATH from the process environment.
    [[nodiscard]] static auto from_environment() -> RootSearchConfig;
};

/// Outcome of the root search.
struct RootResult {
    std::string path;                  ///< Resolved root (or ODIN_ROOT when nothing matched).
    bool found = false;                ///< True if `path/core` exists.
    std::vector<std::string> searched; ///< Every directory that was tried, in order.
};

/// Fixed candidate directories for the current platform.
///
/// @param home Value of HOME (or USERPROFILE); empty to skip home-relative entries.
[[nodiscard]] auto default_candidates(const std::string& home) -> std::vector<std::string>;

/// Directories inferred from every `binary_name` executable found on `path_var`.
[[nodiscard]] auto binary_candidates(const std::string& path_var, const std::string& binary_name)
    -> std::vector<std::string>;

/// True if `root` contains a `core` directory.
[[nodiscard]] auto has_core_library(const std::string& root) -> bool;

/// Runs the search described by `config`.
[[nodiscard]] auto resolve_library_root(const RootSearchConfig& config) -> RootResult;

} // namespace odindoc::toolchain

#endif // ODINDOC_TOOLCHAIN_ROOT_HPP
