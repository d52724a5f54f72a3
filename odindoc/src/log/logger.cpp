//! # Logger Implementation

#include "log/log.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define ODINDOC_STDERR_IS_TTY() (_isatty(_fileno(stderr)) != 0)
#else
#include <unistd.h>
#define ODINDOC_STDERR_IS_TTY() (isatty(fileno(stderr)) != 0)
#endif

namespace odindoc::log {

namespace {

constexpr std::array<std::string_view, 6> LEVEL_NAMES = {"TRACE", "DEBUG", "INFO",
                                                         "WARN",  "ERROR", "OFF"};

constexpr std::array<const char*, 6> LEVEL_COLORS = {
    "\033[90m", // trace: gray
    "\033[36m", // debug: cyan
    "\033[32m", // info: green
    "\033[33m", // warn: yellow
    "\033[31m", // error: red
    "",
};

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// "HH:MM:SS.mmm" in local time.
auto clock_time(int64_t timestamp_ms) -> std::string {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (timestamp_ms % 1000);
    return oss.str();
}

void write_json_string(std::ostream& out, std::string_view s) {
    out << '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            out << c;
        }
    }
    out << '"';
}

auto stderr_supports_color() -> bool {
    if (!ODINDOC_STDERR_IS_TTY()) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
#endif
}

} // namespace

auto level_name(LogLevel level) -> std::string_view {
    return LEVEL_NAMES[static_cast<size_t>(level)];
}

auto parse_level(std::string_view s) -> LogLevel {
    std::string lower(s);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        std::string name(LEVEL_NAMES[i]);
        for (auto& c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == name) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

auto format_record(const LogRecord& record, LogFormat format) -> std::string {
    std::ostringstream oss;
    if (format == LogFormat::JSON) {
        oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":";
        write_json_string(oss, record.module);
        oss << ",\"msg\":";
        write_json_string(oss, record.message);
        oss << "}";
    } else {
        oss << clock_time(record.timestamp_ms) << " " << std::left << std::setw(5)
            << level_name(record.level) << " [" << record.module << "] " << record.message;
    }
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

StreamSink::StreamSink(std::ostream& out, LogFormat format, bool colors)
    : out_(out), format_(format), colors_(colors) {}

void StreamSink::write(const LogRecord& record) {
    if (!colors_ || format_ == LogFormat::JSON) {
        out_ << format_record(record, format_) << "\n";
        return;
    }
    // Color only the level column.
    out_ << clock_time(record.timestamp_ms) << " "
         << LEVEL_COLORS[static_cast<size_t>(record.level)] << std::left << std::setw(5)
         << level_name(record.level) << "\033[0m [" << record.module << "] " << record.message
         << "\n";
}

void StreamSink::flush() {
    out_.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_record(record, format_) << "\n";
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    file_.flush();
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto token = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);
        if (token.empty()) {
            continue;
        }

        auto eq = token.find('=');
        auto module = token.substr(0, eq);
        auto level = eq == std::string_view::npos ? LogLevel::Trace
                                                  : parse_level(token.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level == LogLevel::Off) {
        return false;
    }
    auto it = module_levels_.find(std::string(module));
    auto threshold = it == module_levels_.end() ? default_level_ : it->second;
    return level >= threshold;
}

auto LogFilter::min_level() const -> LogLevel {
    auto min = default_level_;
    for (const auto& [module, level] : module_levels_) {
        if (level < min) {
            min = level;
        }
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<StreamSink>(std::cerr, LogFormat::Text,
                                                  stderr_supports_color()));
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.filter_ = LogFilter();
    logger.filter_.set_default_level(config.level);
    logger.level_ = config.level;
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Without "*=level" the command-line level stays the default.
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        logger.level_ = logger.filter_.min_level();
    }

    logger.sinks_.clear();
    bool colors = config.format == LogFormat::Text && stderr_supports_color();
    logger.sinks_.push_back(std::make_unique<StreamSink>(std::cerr, config.format, colors));

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::write(LogLevel level, std::string_view module, std::string message) {
    LogRecord record{level, std::string(module), std::move(message), now_ms()};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace odindoc::log
