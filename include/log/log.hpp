//! # IRT Logging
//!
//! Diagnostics for the IR library and the `irt` tool. Records carry a level
//! and a module tag (`printer`, `builder`, `symbols`, `verify`, `cli`) and
//! are dispatched to every registered sink under one mutex. The logger starts
//! with no sinks, so library code may log before (or without) `init()`.
//!
//! ```cpp
//! IRT_LOG_DEBUG("printer", "Printing module with " << module.ops.size() << " ops");
//! IRT_LOG_WARN("symbols", "Duplicate symbol @" << name);
//! ```
//!
//! Levels below `IRT_MIN_LOG_LEVEL` compile to nothing.

#ifndef IRT_LOG_HPP
#define IRT_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace irt::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Builder id assignment, per-operand lookups
    Debug = 1, ///< Per-module summaries
    Info = 2,  ///< Verification and output results
    Warn = 3,  ///< Accepted but suspicious input (duplicate symbols)
    Error = 4, ///< Failed verification or I/O
    Fatal = 5,
    Off = 6
};

/// "TRACE", "DEBUG", ...
const char* level_name(LogLevel level);

/// Case-insensitive; anything unrecognized is Info.
LogLevel parse_level(std::string_view s);

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;     ///< __FILE__ of the call site
    int line;             ///< __LINE__ of the call site
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// stderr; level names are coloured only when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
};

/// Plain-text log file (`--log-file=`). Error and Fatal records are flushed
/// immediately.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Filtering
// ============================================================================

/// Per-module thresholds, e.g. "printer=trace,verify=debug,*=warn".
/// `*` sets the default; a module named without a level gets Trace.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Most verbose threshold across the default and every module.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    std::string filter_spec; ///< Empty = level applies to every module
    std::string log_file;    ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Sink dispatch and configuration changes are
/// serialized by a mutex.
class Logger {
public:
    /// Replaces the level, filter and sinks with those described by `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is formatted.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets both the global floor and the filter default.
    void set_level(LogLevel level);

    LogLevel level() const {
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

/// Local wall-clock time as "HH:MM:SS.mmm".
std::string get_timestamp();

int64_t epoch_ms();

// ============================================================================
// Command Line
// ============================================================================

/// Builds a LogConfig from --log-level=, --log-filter=, --log-file=,
/// -v/-vv/-vvv and -q. IRT_LOG (a level name or a filter spec) is consulted
/// only when the command line sets neither a level nor a filter.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for every flag parse_log_options consumes; the driver skips these.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// 0=Trace ... 5=Fatal, 6=Off
#ifndef IRT_MIN_LOG_LEVEL
#define IRT_MIN_LOG_LEVEL 0
#endif

#define IRT_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= IRT_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::irt::log::Logger::instance();                                        \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define IRT_LOG_TRACE(module, msg) IRT_LOG_IMPL(::irt::log::LogLevel::Trace, module, msg)
#define IRT_LOG_DEBUG(module, msg) IRT_LOG_IMPL(::irt::log::LogLevel::Debug, module, msg)
#define IRT_LOG_INFO(module, msg) IRT_LOG_IMPL(::irt::log::LogLevel::Info, module, msg)
#define IRT_LOG_WARN(module, msg) IRT_LOG_IMPL(::irt::log::LogLevel::Warn, module, msg)
#define IRT_LOG_ERROR(module, msg) IRT_LOG_IMPL(::irt::log::LogLevel::Error, module, msg)
#define IRT_LOG_FATAL(module, msg) IRT_LOG_IMPL(::irt::log::LogLevel::Fatal, module, msg)

} // namespace irt::log

#endif // IRT_LOG_HPP
