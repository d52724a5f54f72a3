//! # Declaration Aggregator Implementation

#include "doc/aggregator.hpp"

#include "doc/scanner.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace odindoc::doc {

auto Aggregator::add_entries(std::vector<DocEntry> entries) -> size_t {
    size_t kept = 0;
    for (auto& entry : entries) {
        if (!seen_.insert(entry.name).second) {
            ODINDOC_LOG_DEBUG("aggregate", "Duplicate '" << entry.name << "' at "
                                                         << entry.source_file << ":"
                                                         << entry.source_line << " ignored");
            continue;
        }
        entries_.push_back(std::move(entry));
        ++kept;
    }
    return kept;
}

auto Aggregator::lookup(const std::string& name) const -> LookupResult {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const DocEntry& entry) { return entry.name == name; });
    if (it == entries_.end()) {
        it = std::find_if(entries_.begin(), entries_.end(),
                          [&](const DocEntry& entry) { return binds_name(entry, name); });
    }
    if (it == entries_.end()) {
        return {LookupStatus::NotFound, nullptr};
    }
    return {it->is_private ? LookupStatus::Private : LookupStatus::Found, &*it};
}

auto Aggregator::package_view(bool include_private) const -> PackageView {
    PackageView view;
    for (const auto& entry : entries_) {
        if (entry.is_private && !include_private) {
            continue;
        }
        if (entry.kind == DeclKind::Constant) {
            view.constants.push_back(&entry);
        } else if (is_type_kind(entry.kind)) {
            view.types.push_back(&entry);
        } else {
            view.procedures.push_back(&entry);
        }
    }

    auto by_name = [](const DocEntry* a, const DocEntry* b) { return a->name < b->name; };
    std::sort(view.constants.begin(), view.constants.end(), by_name);
    std::sort(view.types.begin(), view.types.end(), by_name);
    std::sort(view.procedures.begin(), view.procedures.end(), by_name);
    return view;
}

auto aggregate_files(const std::vector<std::string>& paths) -> Aggregator {
    Aggregator aggregator;
    for (const auto& path : paths) {
        auto result = scan_file(path);
        if (is_err(result)) {
            ODINDOC_LOG_DEBUG("aggregate", "Skipping " << path << ": " << unwrap_err(result));
            continue;
        }
        auto kept = aggregator.add_entries(std::move(unwrap(result)));
        ODINDOC_LOG_DEBUG("aggregate", path << ": kept " << kept << " declarations");
    }
    return aggregator;
}

} // namespace odindoc::doc
