//! # Package File Discovery Implementation

#include "toolchain/discovery.hpp"

#include "common.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace odindoc::toolchain {

namespace {

constexpr std::array<std::string_view, 3> COLLECTIONS = {"core", "base", "vendor"};

} // namespace

auto parse_package_ref(const std::string& ref) -> PackageRef {
    auto colon = ref.find(':');
    if (colon != std::string::npos) {
        std::string_view prefix(ref.data(), colon);
        for (auto collection : COLLECTIONS) {
            if (prefix == collection) {
                return {std::string(collection), ref.substr(colon + 1)};
            }
        }
    }
    return {std::nullopt, ref};
}

auto list_directory_sources(const std::string& dir) -> std::vector<std::string> {
    std::vector<std::string> files;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        ODINDOC_LOG_DEBUG("discovery", "Cannot list " << dir << ": " << ec.message());
        return files;
    }

    for (const auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            ODINDOC_LOG_DEBUG("discovery", "Stopped listing " << dir << ": " << ec.message());
            break;
        }
        const auto& path = it->path();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || path.extension() != SOURCE_EXTENSION) {
            continue;
        }
        files.push_back(path.string());
    }

    std::sort(files.begin(), files.end(), [](const std::string& a, const std::string& b) {
        return fs::path(a).filename().string() < fs::path(b).filename().string();
    });
    return files;
}

auto list_source_files(const std::string& ref, const RootResult* root) -> DiscoveryResult {
    DiscoveryResult result;
    auto parsed = parse_package_ref(ref);

    if (parsed.collection) {
        if (root == nullptr || !root->found) {
            result.root_resolved = false;
            return result;
        }
        result.directory = (fs::path(root->path) / *parsed.collection / parsed.name).string();
    } else {
        result.directory = parsed.name;
    }

    result.files = list_directory_sources(result.directory);
    ODINDOC_LOG_DEBUG("discovery", ref << " -> " << result.directory << " ("
                                       << result.files.size() << " files)");
    return result;
}

} // namespace odindoc::toolchain
