//! # Documentation Command Implementation

#include "cmd_doc.hpp"

#include "cli/utils.hpp"
#include "doc/aggregator.hpp"
#include "doc/text_generator.hpp"
#include "log/log.hpp"
#include "toolchain/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace odindoc::cli {

namespace {

auto is_identifier(const std::string& s) -> bool {
    if (s.empty() || (s.front() >= '0' && s.front() <= '9')) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_' || static_cast<unsigned char>(c) >= 0x80;
    });
}

} // namespace

auto parse_target(const std::string& arg) -> DocTarget {
    DocTarget target{arg, std::nullopt};

    std::error_code ec;
    if (fs::is_directory(arg, ec)) {
        return target;
    }

    auto dot = arg.rfind('.');
    if (dot == std::string::npos || arg.find('.') != dot) {
        return target;
    }

    std::string package = arg.substr(0, dot);
    std::string symbol = arg.substr(dot + 1);
    if (package.empty() || !is_identifier(symbol)) {
        return target;
    }
    return {std::move(package), std::move(symbol)};
}

auto parse_doc_args(int argc, char* argv[]) -> DocOptions {
    DocOptions options;
    bool help = false;
    bool version = false;
    bool root = false;
    std::optional<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (log::is_log_option(arg)) {
            // consumed by log::parse_log_options()
        } else if (arg == "--help" || arg == "-h") {
            help = true;
        } else if (arg == "--version" || arg == "-v") {
            version = true;
        } else if (arg == "--root" || arg == "-r") {
            root = true;
        } else if (arg == "--include-private" || arg == "-u") {
            options.include_private = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            ODINDOC_LOG_WARN("cli", "Unknown option '" << arg << "'");
        } else if (positional) {
            ODINDOC_LOG_WARN("cli", "Ignoring extra argument '" << arg << "'");
        } else {
            positional = arg;
        }
    }

    if (help) {
        options.mode = DocMode::Help;
    } else if (version) {
        options.mode = DocMode::Version;
    } else if (root) {
        options.mode = DocMode::Root;
    } else if (positional) {
        options.target = parse_target(*positional);
        options.mode = options.target.symbol ? DocMode::Symbol : DocMode::Package;
    } else {
        options.mode = DocMode::Help;
    }
    return options;
}

int run_root(const toolchain::RootResult& root, std::ostream& out) {
    if (!root.path.empty()) {
        auto core = (fs::path(root.path) / "core").string();
        out << "Odin root: " << root.path << "\n";
        out << "Core library: " << core << (root.found ? " (found)" : " (missing)") << "\n";
    }
    if (!root.found) {
        if (!root.path.empty()) {
            out << "\n";
        }
        out << doc::root_not_found_message(root.searched) << "\n";
    }
    return 0;
}

int run_doc(const DocOptions& options, const toolchain::RootSearchConfig& search,
            std::ostream& out) {
    switch (options.mode) {
    case DocMode::Help:
        print_usage(out);
        return 0;
    case DocMode::Version:
        print_version(out);
        return 0;
    case DocMode::Root:
        return run_root(toolchain::resolve_library_root(search), out);
    case DocMode::Package:
    case DocMode::Symbol:
        break;
    }

    const auto& ref = options.target.package_ref;

    std::optional<toolchain::RootResult> root;
    if (toolchain::parse_package_ref(ref).collection) {
        root = toolchain::resolve_library_root(search);
    }

    auto discovery = toolchain::list_source_files(ref, root ? &*root : nullptr);
    if (!discovery.root_resolved) {
        out << doc::root_not_found_message(root ? root->searched : std::vector<std::string>{})
            << "\n";
        return 0;
    }

    auto aggregator = doc::aggregate_files(discovery.files);
    ODINDOC_LOG_INFO("cli", "Collected " << aggregator.entries().size() << " declarations from "
                                         << discovery.files.size() << " files in "
                                         << discovery.directory);

    doc::TextGenerator generator;

    if (options.mode == DocMode::Symbol) {
        const auto& symbol = *options.target.symbol;
        auto found = aggregator.lookup(symbol);
        switch (found.status) {
        case doc::LookupStatus::Found:
            generator.generate_symbol(*found.entry, out);
            break;
        case doc::LookupStatus::Private:
            out << doc::private_message(symbol, ref) << "\n";
            break;
        case doc::LookupStatus::NotFound:
            out << doc::not_found_message(symbol, ref) << "\n";
            break;
        }
        return 0;
    }

    auto view = aggregator.package_view(options.include_private);
    if (view.empty()) {
        out << doc::empty_package_message(ref) << "\n";
        return 0;
    }
    generator.generate_package(view, ref, out);
    return 0;
}

void print_doc_help(std::ostream& out) {
    out << R"(
Usage: odindoc <package-or-path>
       odindoc <package>.<symbol>
       odindoc --root

Arguments:
  <package-or-path>     A directory, or core:<name> / base:<name> / vendor:<name>
  <package>.<symbol>    Show a single declaration

Options:
  --root, -r            Show the resolved Odin root and whether 'core' exists
  --include-private, -u Include private declarations in package reports
  --version, -v         Show version
  --help, -h            Show this help

Logging:
  --log-level=<level>   trace, debug, info, warn, error, off (default: warn)
  --log-filter=<spec>   Per-module levels, e.g. scan=trace,*=warn
  --log-file=<path>     Also write log messages to a file
  --log-format=<fmt>    text or json
  --verbose, -vv, -vvv  Raise the log level to info, debug, trace
  -q, --quiet           Only log errors

Environment:
  ODIN_ROOT             Odin installation directory (contains 'core')
  ODINDOC_LOG           Log level or filter spec when no flag is given

Examples:
  odindoc core:fmt
  odindoc core:strings.Builder
  odindoc ./src/mypkg
)";
}

} // namespace odindoc::cli
