//! # loom Logging
//!
//! Structured, module-tagged logging used by every stage of the engine:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags (`build`, `pipeline`, `resolve`, `load`, `config`, `cli`)
//!   with per-module filtering
//! - Console, file and null sinks
//! - Thread-safe dispatch; worker threads log concurrently
//! - Compile-time level elision via LOOM_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! LOOM_LOG_INFO("build", "module count: " << count);
//! LOOM_LOG_DEBUG("resolve", specifier << " -> " << path);
//! ```

#ifndef LOOM_LOG_HPP
#define LOOM_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace loom::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-module pipeline tracing
    Debug = 1, ///< Resolution and integration details
    Info = 2,  ///< Build progress and summaries
    Warn = 3,  ///< Suspicious but recoverable input
    Error = 4, ///< Build failures
    Fatal = 5, ///< Unrecoverable internal failures
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name (lower or upper case). Unknown names map to Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as a single text line (with trailing newline).
std::string format_text(const LogRecord& record, const char* color_on = nullptr,
                        const char* color_off = nullptr);

/// Renders a record as a single JSON object line (with trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a log file. Flushes eagerly on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like `"build=debug,resolve=trace,*=warn"`. A bare module name
/// enables everything from that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module (fast-path threshold).
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Auto-initializes with a console sink on first use.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes all sinks (tests install capture sinks after this).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the LOOM_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef LOOM_MIN_LOG_LEVEL
#define LOOM_MIN_LOG_LEVEL 0
#endif

#define LOOM_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= LOOM_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::loom::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define LOOM_LOG_TRACE(module, msg) LOOM_LOG_IMPL(::loom::log::LogLevel::Trace, module, msg)
#define LOOM_LOG_DEBUG(module, msg) LOOM_LOG_IMPL(::loom::log::LogLevel::Debug, module, msg)
#define LOOM_LOG_INFO(module, msg) LOOM_LOG_IMPL(::loom::log::LogLevel::Info, module, msg)
#define LOOM_LOG_WARN(module, msg) LOOM_LOG_IMPL(::loom::log::LogLevel::Warn, module, msg)
#define LOOM_LOG_ERROR(module, msg) LOOM_LOG_IMPL(::loom::log::LogLevel::Error, module, msg)
#define LOOM_LOG_FATAL(module, msg) LOOM_LOG_IMPL(::loom::log::LogLevel::Fatal, module, msg)

} // namespace loom::log

#endif // LOOM_LOG_HPP
