//! # Documentation Model Implementation

#include "doc/doc_model.hpp"

namespace odindoc::doc {

auto decl_kind_to_string(DeclKind kind) -> std::string_view {
    switch (kind) {
    case DeclKind::Procedure:
        return "procedure";
    case DeclKind::Struct:
        return "struct";
    case DeclKind::Enum:
        return "enum";
    case DeclKind::Union:
        return "union";
    case DeclKind::BitSet:
        return "bit_set";
    case DeclKind::Constant:
        return "constant";
    }
    return "unknown";
}

auto is_private_name(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    char first = name.front();
    return first == '_' || (first >= 'a' && first <= 'z');
}

auto binds_name(const DocEntry& entry, std::string_view name) -> bool {
    std::string_view names = entry.name;
    while (true) {
        auto comma = names.find(',');
        auto part = names.substr(0, comma);
        while (!part.empty() && part.front() == ' ') {
            part.remove_prefix(1);
        }
        if (part == name) {
            return true;
        }
        if (comma == std::string_view::npos) {
            return false;
        }
        names.remove_prefix(comma + 1);
    }
}

} // namespace odindoc::doc
