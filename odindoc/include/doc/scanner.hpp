//! # Declaration Scanner
//!
//! Extracts documented declarations from Odin source text without building a
//! syntax tree. The scanner makes a single pass over the lines of one file,
//! classifies each line and updates a small amount of carried state:
//!
//! | State             | Meaning                                            |
//! |-------------------|----------------------------------------------------|
//! | `pending_comment` | Comment block collected since the last code line   |
//! | `pending_private` | An `@(private)` attribute line was just seen       |
//! | `last_was_code`   | Previous line was ordinary code                    |
//! | `file_private`    | A `#+private` file tag was seen                    |
//! | `body_depth`      | Open braces of the last declaration's body         |
//!
//! ## Line Categories
//!
//! Checked in this order:
//!
//! 1. `FilePrivate`: `#+private` or `//+private` file tag
//! 2. `Comment`: starts with `//`
//! 3. `Blank`: whitespace only
//! 4. `PrivateAttribute`: only attributes, one of them `private`
//!    (`@(private)`, `@(init, private)`, `@(private="file")`, `@private`)
//! 5. `Attribute`: only other attributes (`@(require_results)`)
//! 6. `Declaration`: optional attributes, then `name :: value` or
//!    `a, b :: x, y`
//! 7. `Code`: everything else
//!
//! A comment directly after a code line is a trailing comment and is dropped.
//! A code line orphans any comment block collected before it. Attribute
//! lines keep the collected comment for the declaration below them.
//!
//! Lines inside the brace-delimited body of a declaration (a procedure body,
//! struct fields) are code, so local `Name :: value` bindings never become
//! entries. Braces of other blocks (`when`, `foreign`) are not tracked.
//!
//! ## Usage
//!
//! ```cpp
//! auto entries = scan_source("// Adds.\nAdd :: proc(a, b: int) -> int { return a + b }",
//!                            "math.odin");
//! // entries[0].signature == "proc(a, b: int) -> int"
//! ```

#ifndef ODINDOC_DOC_SCANNER_HPP
#define ODINDOC_DOC_SCANNER_HPP

#include "common.hpp"
#include "doc/doc_model.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace odindoc::doc {

/// Classification of a single source line.
enum class LineCategory {
    PrivateAttribute, ///< Attribute line marking the next declaration private.
    Attribute,        ///< Attribute line without `private`.
    FilePrivate,      ///< `#+private` file tag.
    Comment,          ///< `//` line comment.
    Blank,            ///< Empty or whitespace only.
    Declaration,      ///< Top-level `name :: value` binding.
    Code,             ///< Any other line.
};

/// Classifies one line of source text (without its line terminator),
/// ignoring any enclosing declaration body.
[[nodiscard]] auto classify_line(std::string_view line) -> LineCategory;

/// Derives the declaration kind from the leading token of a signature.
///
/// `proc`, `struct`, `enum`, `union` and `bit_set` map to their kinds;
/// everything else is a Constant. `#force_inline` / `#force_no_inline`
/// prefixes are skipped.
[[nodiscard]] auto classify_kind(std::string_view signature) -> DeclKind;

/// Returns `line` up to (not including) a `//` comment that is outside any
/// string or rune literal.
[[nodiscard]] auto strip_line_comment(std::string_view line) -> std::string_view;

/// Scans the full text of one source file.
///
/// Never fails: lines that cannot be interpreted are treated as code.
///
/// @param text The file contents.
/// @param source_file Path recorded on every produced entry.
/// @returns Entries in order of appearance.
[[nodiscard]] auto scan_source(std::string_view text, const std::string& source_file)
    -> std::vector<DocEntry>;

/// Reads and scans one file.
///
/// @returns The entries, or an error message if the file cannot be read.
[[nodiscard]] auto scan_file(const std::string& path)
    -> Result<std::vector<DocEntry>, std::string>;

} // namespace odindoc::doc

#endif // ODINDOC_DOC_SCANNER_HPP
