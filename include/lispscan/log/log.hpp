//! # lispscan Logging
//!
//! A small structured logger shared by the scanner library and the
//! `lispscan` tool:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks, text or JSON lines
//! - Mutex-serialized sink writes
//! - Compile-time level elision via LISPSCAN_MIN_LOG_LEVEL
//!
//! The logger has no sinks until `Logger::init()` runs, so a library user
//! that never configures logging sees no output.
//!
//! ## Usage
//!
//! ```cpp
//! LISPSCAN_LOG_WARN("scanner", pos << ": literal not terminated");
//! LISPSCAN_LOG_TRACE("reader", "refill: " << n << " bytes");
//! ```

#ifndef LISPSCAN_LOG_LOG_HPP
#define LISPSCAN_LOG_LOG_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lispscan::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Buffer refills, per-token tracing
    Debug = 1, ///< Configuration changes
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Lexical errors in the input
    Error = 4, ///< I/O failures
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level (e.g. "WARN").
auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case. Unknown names give `LogLevel::Info`.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag ("scanner", "reader", "cli")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log records.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as one text line, without the trailing newline.
auto format_text(const LogRecord& record) -> std::string;

/// Renders a record as one JSON object, without the trailing newline.
auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Writes a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flushes any buffered output.
    virtual void flush() = 0;
};

/// Sink writing to a stream (stderr by default) with optional ANSI colors.
///
/// Colors are only used when the target is stderr and stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    explicit ConsoleSink(std::ostream& out);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Sink appending to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Sink that discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter.
///
/// Parses specs like `"scanner=debug,reader=trace,*=warn"`. A bare module
/// name enables Trace for that module; `*` sets the default level.
class LogFilter {
public:
    LogFilter() = default;

    /// Replaces the module table with the one described by `spec`.
    void parse(std::string_view spec);

    /// Checks whether a record at `level` from `module` passes.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module (or the default) lets through.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for `Logger::init()`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum level
    LogFormat format = LogFormat::Text; ///< Output format for every sink
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Log file path (empty = none)
    bool console = true;                ///< Enable the stderr sink
    bool colors = true;                 ///< Enable ANSI colors on stderr
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger dispatching records to its sinks.
class Logger {
public:
    /// Replaces the sinks, level and filter of the global logger.
    static void init(const LogConfig& config);

    /// Returns the global logger.
    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before formatting a message.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    /// Writes a record to all sinks.
    void log(const LogRecord& record);

    /// Builds a record and writes it to all sinks.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
auto get_timestamp() -> std::string;

/// Milliseconds since the epoch.
auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts logging options from argv.
///
/// Recognizes `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=text|json`, `-q`/`--quiet` and `-v`/`-vv`/`-vvv`. Without
/// a level or filter on the command line, `LISPSCAN_LOG` is consulted: a
/// value containing `=` or `,` is a filter spec, anything else a level.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Reports whether `arg` is one of the options `parse_log_options` consumes.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef LISPSCAN_MIN_LOG_LEVEL
#define LISPSCAN_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define LISPSCAN_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= LISPSCAN_MIN_LOG_LEVEL) {                                   \
            auto& logger_ = ::lispscan::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define LISPSCAN_LOG_TRACE(module, msg) LISPSCAN_LOG_IMPL(::lispscan::log::LogLevel::Trace, module, msg)
#define LISPSCAN_LOG_DEBUG(module, msg) LISPSCAN_LOG_IMPL(::lispscan::log::LogLevel::Debug, module, msg)
#define LISPSCAN_LOG_INFO(module, msg) LISPSCAN_LOG_IMPL(::lispscan::log::LogLevel::Info, module, msg)
#define LISPSCAN_LOG_WARN(module, msg) LISPSCAN_LOG_IMPL(::lispscan::log::LogLevel::Warn, module, msg)
#define LISPSCAN_LOG_ERROR(module, msg) LISPSCAN_LOG_IMPL(::lispscan::log::LogLevel::Error, module, msg)
#define LISPSCAN_LOG_FATAL(module, msg) LISPSCAN_LOG_IMPL(::lispscan::log::LogLevel::Fatal, module, msg)

} // namespace lispscan::log

#endif // LISPSCAN_LOG_LOG_HPP
