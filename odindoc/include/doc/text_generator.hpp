//! # Text Report Generator
//!
//! Renders aggregated declarations as a Go-`doc`-style plain text report.
//!
//! ## Package Report
//!
//! ```text
//! package fmt // import "core:fmt"
//!
//! CONSTANTS
//!
//! Version :: "1.0"
//!     Current version.
//!
//! PROCEDURES
//!
//! println :: proc(args: ..any)
//!     Prints its arguments followed by a newline.
//! ```
//!
//! Groups without entries are omitted.

#ifndef ODINDOC_DOC_TEXT_GENERATOR_HPP
#define ODINDOC_DOC_TEXT_GENERATOR_HPP

#include "doc/aggregator.hpp"
#include "doc/doc_model.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace odindoc::doc {

/// Configuration for text output.
struct GeneratorConfig {
    int indent = 4;          ///< Spaces before each documentation line.
    bool show_source = true; ///< Print the defining file and line for symbols.
};

class TextGenerator {
public:
    explicit TextGenerator(GeneratorConfig config = {});

    /// Writes the report for a whole package.
    ///
    /// @param view Grouped entries from `Aggregator::package_view()`.
    /// @param package_ref The package as given on the command line.
    void generate_package(const PackageView& view, const std::string& package_ref,
                          std::ostream& out) const;

    /// Writes the report for one declaration.
    void generate_symbol(const DocEntry& entry, std::ostream& out) const;

    /// Writes one declaration: signature line followed by indented docs.
    void generate_entry(const DocEntry& entry, std::ostream& out) const;

private:
    GeneratorConfig config_;

    void write_section(const char* title, const std::vector<const DocEntry*>& entries,
                       std::ostream& out) const;
    void write_doc(const std::string& doc, std::ostream& out) const;
};

/// Short package name for the report header: "core:fmt" -> "fmt",
/// "src/math/linalg/" -> "linalg".
[[nodiscard]] auto package_display_name(const std::string& package_ref) -> std::string;

// ============================================================================
// User-facing messages
// ============================================================================

[[nodiscard]] auto not_found_message(const std::string& symbol, const std::string& package_ref)
    -> std::string;

[[nodiscard]] auto private_message(const std::string& symbol, const std::string& package_ref)
    -> std::string;

[[nodiscard]] auto empty_package_message(const std::string& package_ref) -> std::string;

/// Diagnostic printed when a `core:` reference cannot be resolved.
///
/// @param searched Candidate directories that were tried, in order.
[[nodiscard]] auto root_not_found_message(const std::vector<std::string>& searched)
    -> std::string;

} // namespace odindoc::doc

#endif // ODINDOC_DOC_TEXT_GENERATOR_HPP
