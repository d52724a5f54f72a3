//! # odindoc Logging
//!
//! Diagnostics for odindoc. Reports are written to stdout by the CLI; every
//! record that goes through this logger ends up on stderr or in a log file,
//! so logging never mixes with report text.
//!
//! Records carry a module tag (`scan`, `aggregate`, `root`, `discovery`,
//! `cli`) that `--log-filter` and `ODINDOC_LOG` select on.
//!
//! ## Usage
//!
//! ```cpp
//! ODINDOC_LOG_DEBUG("scan", "Scanned " << path << ": " << entries.size() << " entries");
//! ODINDOC_LOG_WARN("root", "ODIN_ROOT=" << dir << " has no 'core' directory");
//! ```

#ifndef ODINDOC_LOG_HPP
#define ODINDOC_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace odindoc::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Per-line scanner decisions
    Debug = 1, ///< Per-file and per-candidate details
    Info = 2,  ///< Summary of a run
    Warn = 3,  ///< Ignored options, suspicious environment
    Error = 4, ///< Internal failures
    Off = 5,
};

/// Upper-case level name used in text and JSON output ("WARN").
[[nodiscard]] auto level_name(LogLevel level) -> std::string_view;

/// Parses a level name ignoring case; "warning" is accepted for Warn.
/// Unknown names give Info.
[[nodiscard]] auto parse_level(std::string_view s) -> LogLevel;

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string module;
    std::string message;
    int64_t timestamp_ms = 0; ///< Milliseconds since epoch.
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON, ///< One object per line: ts, level, module, msg
};

/// Renders one record without a trailing newline.
[[nodiscard]] auto format_record(const LogRecord& record, LogFormat format) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

/// Writes to a borrowed stream. The CLI installs one on std::cerr; the
/// stream must outlive the sink.
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out, LogFormat format = LogFormat::Text,
                        bool colors = false);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
    LogFormat format_;
    bool colors_;
};

/// Appends to a file given with `--log-file`. Error records are flushed
/// immediately.
class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogFormat format, bool append = true);

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ofstream file_;
    LogFormat format_;
};

// ============================================================================
// Module Filter
// ============================================================================

/// Per-module levels parsed from "scan=trace,root,*=warn".
///
/// A bare module name enables Trace for it; `*` sets the default for
/// modules not listed.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level enabled for any module.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty: every module uses `level`.
    std::string log_file;    ///< Empty: stderr only.
};

/// Process-wide logger. Until `init()` runs it logs Warn and above to stderr.
class Logger {
public:
    static auto instance() -> Logger&;

    /// Replaces the sinks and levels with the ones described by `config`.
    static void init(const LogConfig& config);

    /// Cheap check done by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void write(LogLevel level, std::string_view module, std::string message);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();
    void set_level(LogLevel level);
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Builds a LogConfig from `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=`, `--verbose`, `-vv`, `-vvv` and `-q`/`--quiet`.
/// A lone `-v` is the version flag and is left alone. Without a level or
/// filter on the command line, ODINDOC_LOG is used.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// True for every argument parse_log_options() consumes.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

} // namespace odindoc::log

// ============================================================================
// Macros
// ============================================================================

// Records below this level are compiled out (0 = Trace ... 4 = Error).
#ifndef ODINDOC_MIN_LOG_LEVEL
#define ODINDOC_MIN_LOG_LEVEL 0
#endif

#define ODINDOC_LOG_AT(level, module, msg)                                                         \
    do {                                                                                           \
        if (static_cast<int>(level) >= ODINDOC_MIN_LOG_LEVEL) {                                    \
            auto& odindoc_logger_ = ::odindoc::log::Logger::instance();                            \
            if (odindoc_logger_.should_log(level, module)) {                                       \
                std::ostringstream odindoc_msg_;                                                   \
                odindoc_msg_ << msg;                                                               \
                odindoc_logger_.write(level, module, odindoc_msg_.str());                          \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define ODINDOC_LOG_TRACE(module, msg) ODINDOC_LOG_AT(::odindoc::log::LogLevel::Trace, module, msg)
#define ODINDOC_LOG_DEBUG(module, msg) ODINDOC_LOG_AT(::odindoc::log::LogLevel::Debug, module, msg)
#define ODINDOC_LOG_INFO(module, msg) ODINDOC_LOG_AT(::odindoc::log::LogLevel::Info, module, msg)
#define ODINDOC_LOG_WARN(module, msg) ODINDOC_LOG_AT(::odindoc::log::LogLevel::Warn, module, msg)
#define ODINDOC_LOG_ERROR(module, msg) ODINDOC_LOG_AT(::odindoc::log::LogLevel::Error, module, msg)

#endif // ODINDOC_LOG_HPP
