//! # Declaration Aggregator
//!
//! Collects scanner output for every file of a package, removes duplicate
//! names and answers the two queries the CLI needs:
//!
//! - `lookup()`: one symbol, with a distinct outcome for private symbols
//! - `package_view()`: public declarations grouped for display
//!
//! Files must be added in enumeration order. The first declaration of a name
//! wins; later ones are dropped regardless of their content.

#ifndef ODINDOC_DOC_AGGREGATOR_HPP
#define ODINDOC_DOC_AGGREGATOR_HPP

#include "doc/doc_model.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace odindoc::doc {

/// Outcome of a single-symbol lookup.
enum class LookupStatus {
    Found,    ///< Public declaration found.
    Private,  ///< Declaration exists but is private.
    NotFound, ///< No declaration with that name.
};

/// Result of `Aggregator::lookup()`. `entry` is null when NotFound.
struct LookupResult {
    LookupStatus status = LookupStatus::NotFound;
    const DocEntry* entry = nullptr;
};

/// Declarations of a package grouped in display order, each group sorted by
/// name. Pointers refer into the Aggregator that produced the view.
struct PackageView {
    std::vector<const DocEntry*> constants;
    std::vector<const DocEntry*> types;
    std::vector<const DocEntry*> procedures;

    [[nodiscard]] auto empty() const -> bool {
        return constants.empty() && types.empty() && procedures.empty();
    }

    [[nodiscard]] auto size() const -> size_t {
        return constants.size() + types.size() + procedures.size();
    }
};

class Aggregator {
public:
    /// Appends the entries of one file, skipping names already seen.
    ///
    /// @returns The number of entries that were kept.
    auto add_entries(std::vector<DocEntry> entries) -> size_t;

    /// All retained entries in insertion order.
    [[nodiscard]] auto entries() const -> const std::vector<DocEntry>& {
        return entries_;
    }

    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

    /// Finds a declaration by exact name, falling back to an `A, B` entry
    /// that binds it.
    [[nodiscard]] auto lookup(const std::string& name) const -> LookupResult;

    /// Groups entries into constants, types and procedures.
    ///
    /// @param include_private Keep private entries instead of filtering them.
    [[nodiscard]] auto package_view(bool include_private = false) const -> PackageView;

private:
    std::vector<DocEntry> entries_;
    std::unordered_set<std::string> seen_;
};

/// Scans every file in order and aggregates the results.
///
/// Files that cannot be read are skipped.
[[nodiscard]] auto aggregate_files(const std::vector<std::string>& paths) -> Aggregator;

} // namespace odindoc::doc

#endif // ODINDOC_DOC_AGGREGATOR_HPP
