//! # Log Options
//!
//! Turns logging flags and the ODINDOC_LOG environment variable into a
//! LogConfig. The CLI parser skips every argument accepted here.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>

namespace odindoc::log {

namespace {

constexpr std::string_view LEVEL_FLAG = "--log-level=";
constexpr std::string_view FILTER_FLAG = "--log-filter=";
constexpr std::string_view FILE_FLAG = "--log-file=";
constexpr std::string_view FORMAT_FLAG = "--log-format=";

/// Number of `v`s in "-vv" / "-vvv"; 0 otherwise. "-v" is the version flag.
auto verbosity_of(std::string_view arg) -> int {
    if (arg.size() < 3 || arg[0] != '-') {
        return 0;
    }
    if (arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto env_log_setting() -> std::optional<std::string> {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, "ODINDOC_LOG") != 0 || buf == nullptr) {
        return std::nullopt;
    }
    std::string value = buf;
    free(buf);
#else
    const char* raw = std::getenv("ODINDOC_LOG");
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = raw;
#endif
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto is_log_option(std::string_view arg) -> bool {
    for (auto flag : {LEVEL_FLAG, FILTER_FLAG, FILE_FLAG, FORMAT_FLAG}) {
        if (arg.starts_with(flag)) {
            return true;
        }
    }
    return arg == "-q" || arg == "--quiet" || arg == "--verbose" || verbosity_of(arg) > 0;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with(LEVEL_FLAG)) {
            explicit_level = parse_level(arg.substr(LEVEL_FLAG.size()));
        } else if (arg.starts_with(FILTER_FLAG)) {
            config.filter_spec = std::string(arg.substr(FILTER_FLAG.size()));
        } else if (arg.starts_with(FILE_FLAG)) {
            config.log_file = std::string(arg.substr(FILE_FLAG.size()));
        } else if (arg.starts_with(FORMAT_FLAG)) {
            auto format = arg.substr(FORMAT_FLAG.size());
            config.format = (format == "json" || format == "JSON") ? LogFormat::JSON
                                                                    : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_of(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbosity > 0) {
        // --verbose = Info, -vv = Debug, -vvv = Trace
        config.level = verbosity >= 3 ? LogLevel::Trace
                       : verbosity == 2 ? LogLevel::Debug
                                        : LogLevel::Info;
    } else if (config.filter_spec.empty()) {
        if (auto env = env_log_setting()) {
            // "scan=trace,*=warn" and "scan,root" are filters; anything else a level
            if (env->find_first_of("=,") != std::string::npos) {
                config.filter_spec = *env;
            } else {
                config.level = parse_level(*env);
            }
        }
    }

    return config;
}

} // namespace odindoc::log
