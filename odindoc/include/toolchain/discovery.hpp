//! # Package File Discovery
//!
//! Turns a package reference into the ordered list of source files to scan.
//!
//! | Reference          | Directory                      |
//! |--------------------|--------------------------------|
//! | `path/to/pkg`      | `path/to/pkg`                  |
//! | `core:fmt`         | `<root>/core/fmt`              |
//! | `base:runtime`     | `<root>/base/runtime`          |
//! | `vendor:raylib`    | `<root>/vendor/raylib`         |
//!
//! Only the immediate `.odin` files of the directory are listed, sorted by
//! file name. Missing or unreadable directories produce an empty list.

#ifndef ODINDOC_TOOLCHAIN_DISCOVERY_HPP
#define ODINDOC_TOOLCHAIN_DISCOVERY_HPP

#include "toolchain/root.hpp"

#include <optional>
#include <string>
#include <vector>

namespace odindoc::toolchain {

/// A package reference split into its collection and relative name.
struct PackageRef {
    std::optional<std::string> collection; ///< "core", "base", "vendor"; empty for paths.
    std::string name;                      ///< Path below the collection, or the raw path.
};

/// Classifies a reference. Only the collections listed above are recognized;
/// anything else (including Windows drive letters) is a filesystem path.
[[nodiscard]] auto parse_package_ref(const std::string& ref) -> PackageRef;

/// Files of one package.
struct DiscoveryResult {
    std::vector<std::string> files; ///< Source files in enumeration order.
    bool root_resolved = true;      ///< False if a collection needed a root that was not found.
    std::string directory;          ///< Directory that was listed.
};

/// Lists the immediate source files of `dir`, sorted by file name.
[[nodiscard]] auto list_directory_sources(const std::string& dir) -> std::vector<std::string>;

/// Lists the source files of a package.
///
/// @param ref Directory path or `collection:name` reference.
/// @param root Resolved installation root; only consulted for collection
///             references. Null means "not resolved".
[[nodiscard]] auto list_source_files(const std::string& ref, const RootResult* root)
    -> DiscoveryResult;

} // namespace odindoc::toolchain

#endif // ODINDOC_TOOLCHAIN_DISCOVERY_HPP
