//! # Odin Root Resolution Implementation

#include "toolchain/root.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace odindoc::toolchain {

namespace {

#ifdef _WIN32
constexpr char PATH_SEPARATOR = ';';
constexpr const char* BINARY_NAME = "odin.exe";
#else
constexpr char PATH_SEPARATOR = ':';
constexpr const char* BINARY_NAME = "odin";
#endif

auto read_env(const char* name) -> std::optional<std::string> {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
        return std::nullopt;
    }
    std::string value = buf;
    free(buf);
    return value;
#else
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

auto directory_exists(const fs::path& path) -> bool {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

void push_unique(std::vector<std::string>& list, const fs::path& path) {
    auto str = path.lexically_normal().generic_string();
    while (str.size() > 1 && str.back() == '/') {
        str.pop_back();
    }
    if (std::find(list.begin(), list.end(), str) == list.end()) {
        list.push_back(std::move(str));
    }
}

} // namespace

auto RootSearchConfig::from_environment() -> RootSearchConfig {
    RootSearchConfig config;
    config.env_root = read_env("ODIN_ROOT");
    if (config.env_root && config.env_root->empty()) {
        config.env_root.reset();
    }
#ifdef _WIN32
    auto home = read_env("USERPROFILE");
#else
    auto home = read_env("HOME");
#endif
    config.candidates = default_candidates(home.value_or(""));
    config.path_var = read_env("PATH").value_or("");
    config.binary_name = BINARY_NAME;
    return config;
}

auto default_candidates(const std::string& home) -> std::vector<std::string> {
    std::vector<std::string> dirs;
#if defined(_WIN32)
    dirs = {"C:/odin", "C:/Program Files/odin", "C:/Program Files (x86)/odin"};
    if (!home.empty()) {
        dirs.push_back(home + "/odin");
    }
#else
#if defined(__APPLE__)
    dirs = {"/opt/homebrew/opt/odin/libexec", "/usr/local/opt/odin/libexec"};
#endif
    for (const char* dir :
         {"/usr/lib/odin", "/usr/local/lib/odin", "/usr/share/odin", "/usr/local/share/odin",
          "/opt/odin"}) {
        dirs.emplace_back(dir);
    }
    if (!home.empty()) {
        dirs.push_back(home + "/odin");
        dirs.push_back(home + "/.local/share/odin");
    }
#endif
    return dirs;
}

auto binary_candidates(const std::string& path_var, const std::string& binary_name)
    -> std::vector<std::string> {
    std::vector<std::string> dirs;
    if (binary_name.empty()) {
        return dirs;
    }

    size_t pos = 0;
    while (pos <= path_var.size()) {
        auto sep = path_var.find(PATH_SEPARATOR, pos);
        if (sep == std::string::npos) {
            sep = path_var.size();
        }
        std::string entry = path_var.substr(pos, sep - pos);
        pos = sep + 1;
        if (entry.empty()) {
            continue;
        }

        fs::path binary = fs::path(entry) / binary_name;
        std::error_code ec;
        if (!fs::exists(binary, ec)) {
            continue;
        }
        ODINDOC_LOG_DEBUG("root", "Found " << binary.string() << " on PATH");

        // The binary usually sits next to `core`; package layouts put it in
        // bin/ with the library under lib/, share/ or libexec/.
        std::vector<fs::path> bin_dirs = {binary.parent_path()};
        auto real = fs::canonical(binary, ec);
        if (!ec && real.parent_path() != binary.parent_path()) {
            bin_dirs.push_back(real.parent_path());
        }
        for (const auto& dir : bin_dirs) {
            push_unique(dirs, dir);
            push_unique(dirs, dir.parent_path() / "lib" / "odin");
            push_unique(dirs, dir.parent_path() / "share" / "odin");
            push_unique(dirs, dir.parent_path() / "libexec" / "odin");
        }
    }
    return dirs;
}

auto has_core_library(const std::string& root) -> bool {
    return !root.empty() && directory_exists(fs::path(root) / "core");
}

auto resolve_library_root(const RootSearchConfig& config) -> RootResult {
    RootResult result;

    auto try_candidate = [&](const std::string& dir) -> bool {
        if (std::find(result.searched.begin(), result.searched.end(), dir) !=
            result.searched.end()) {
            return false;
        }
        result.searched.push_back(dir);
        if (has_core_library(dir)) {
            ODINDOC_LOG_DEBUG("root", "Using Odin root " << dir);
            result.path = dir;
            result.found = true;
            return true;
        }
        ODINDOC_LOG_TRACE("root", "No core library under " << dir);
        return false;
    };

    if (config.env_root && try_candidate(*config.env_root)) {
        return result;
    }
    if (config.env_root) {
        ODINDOC_LOG_WARN("root", "ODIN_ROOT=" << *config.env_root
                                              << " has no 'core' directory, searching elsewhere");
    }

    for (const auto& dir : config.candidates) {
        if (try_candidate(dir)) {
            return result;
        }
    }

    for (const auto& dir : binary_candidates(config.path_var, config.binary_name)) {
        if (try_candidate(dir)) {
            return result;
        }
    }

    if (config.env_root) {
        result.path = *config.env_root;
    }
    return result;
}

} // namespace odindoc::toolchain
