//! # Text Report Generator Implementation

#include "doc/text_generator.hpp"

#include <sstream>

namespace odindoc::doc {

TextGenerator::TextGenerator(GeneratorConfig config) : config_(std::move(config)) {}

void TextGenerator::generate_package(const PackageView& view, const std::string& package_ref,
                                     std::ostream& out) const {
    out << "package " << package_display_name(package_ref) << " // import \"" << package_ref
        << "\"\n";

    write_section("CONSTANTS", view.constants, out);
    write_section("TYPES", view.types, out);
    write_section("PROCEDURES", view.procedures, out);
}

void TextGenerator::generate_symbol(const DocEntry& entry, std::ostream& out) const {
    generate_entry(entry, out);
    if (config_.show_source) {
        out << "\n// defined in " << entry.source_file << ":" << entry.source_line << "\n";
    }
}

void TextGenerator::generate_entry(const DocEntry& entry, std::ostream& out) const {
    out << entry.name << " ::";
    if (!entry.signature.empty()) {
        out << " " << entry.signature;
    }
    out << "\n";
    write_doc(entry.doc, out);
}

void TextGenerator::write_section(const char* title, const std::vector<const DocEntry*>& entries,
                                  std::ostream& out) const {
    if (entries.empty()) {
        return;
    }
    out << "\n" << title << "\n";
    for (const auto* entry : entries) {
        out << "\n";
        generate_entry(*entry, out);
    }
}

void TextGenerator::write_doc(const std::string& doc, std::ostream& out) const {
    if (doc.empty()) {
        return;
    }
    const std::string pad(static_cast<size_t>(config_.indent), ' ');
    std::istringstream stream(doc);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) {
            out << "\n";
        } else {
            out << pad << line << "\n";
        }
    }
}

auto package_display_name(const std::string& package_ref) -> std::string {
    std::string name = package_ref;
    while (name.size() > 1 && (name.back() == '/' || name.back() == '\\')) {
        name.pop_back();
    }
    auto cut = name.find_last_of("/\\:");
    if (cut != std::string::npos && cut + 1 < name.size()) {
        name = name.substr(cut + 1);
    }
    if (name.empty() || name == "." || name == "..") {
        return package_ref;
    }
    return name;
}

auto not_found_message(const std::string& symbol, const std::string& package_ref)
    -> std::string {
    return "Symbol '" + symbol + "' not found in package '" + package_ref + "'";
}

auto private_message(const std::string& symbol, const std::string& package_ref) -> std::string {
    return "Symbol '" + symbol + "' in package '" + package_ref + "' is private";
}

auto empty_package_message(const std::string& package_ref) -> std::string {
    return "No documented declarations found in package '" + package_ref + "'";
}

auto root_not_found_message(const std::vector<std::string>& searched) -> std::string {
    std::ostringstream oss;
    oss << "Could not locate the Odin installation root.\n";
    if (!searched.empty()) {
        oss << "Searched:\n";
        for (const auto& dir : searched) {
            oss << "  " << dir << "\n";
        }
    }
    oss << "Set the ODIN_ROOT environment variable to the directory that contains 'core'.";
    return oss.str();
}

} // namespace odindoc::doc
