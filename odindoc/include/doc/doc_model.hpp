//! # Documentation Model
//!
//! Data structures for extracted documentation.
//!
//! ## Architecture
//!
//! - `DocEntry`: one documented top-level `name :: value` binding
//! - `DeclKind`: what the right-hand side of the binding declares
//!
//! Entries are produced by the scanner (`doc/scanner.hpp`), collected by the
//! aggregator (`doc/aggregator.hpp`) and printed by the text generator
//! (`doc/text_generator.hpp`). They are plain values and never change once
//! produced.

#ifndef ODINDOC_DOC_DOC_MODEL_HPP
#define ODINDOC_DOC_DOC_MODEL_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace odindoc::doc {

// ============================================================================
// Declaration Kinds
// ============================================================================

/// The kind of a documented declaration, derived from its signature.
enum class DeclKind {
    Procedure, ///< `proc(...)`
    Struct,    ///< `struct {...}`
    Enum,      ///< `enum {...}`
    Union,     ///< `union {...}`
    BitSet,    ///< `bit_set[...]`
    Constant,  ///< Anything else.
};

/// Converts DeclKind to its lower-case name ("procedure", "bit_set", ...).
[[nodiscard]] auto decl_kind_to_string(DeclKind kind) -> std::string_view;

/// True for the kinds listed under TYPES in a package report.
[[nodiscard]] constexpr auto is_type_kind(DeclKind kind) -> bool {
    return kind == DeclKind::Struct || kind == DeclKind::Enum || kind == DeclKind::Union ||
           kind == DeclKind::BitSet;
}

// ============================================================================
// DocEntry
// ============================================================================

/// A documented declaration.
struct DocEntry {
    std::string name;                   ///< Bound identifier: "Add", or "A, B" for a list.
    DeclKind kind = DeclKind::Constant; ///< What the binding declares.
    std::string signature;              ///< Right-hand side without body: "proc(a, b: int) -> int".

    /// Comment block directly above the declaration with the `//` markers
    /// stripped, one line per segment. Interior blank lines are kept as empty
    /// segments.
    std::string doc;

    std::string source_file;  ///< Source file path.
    uint32_t source_line = 0; ///< 1-based line number.
    bool is_private = false;  ///< Marked private or private by naming convention.

    [[nodiscard]] auto operator==(const DocEntry& other) const -> bool = default;
};

/// True if `name` is private by convention: a leading underscore or a
/// lowercase ASCII first letter.
[[nodiscard]] auto is_private_name(std::string_view name) -> bool;

/// True if `entry` binds `name`, alone or as one of a `A, B :: ...` list.
[[nodiscard]] auto binds_name(const DocEntry& entry, std::string_view name) -> bool;

} // namespace odindoc::doc

#endif // ODINDOC_DOC_DOC_MODEL_HPP
