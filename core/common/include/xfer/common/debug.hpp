#pragma once

/**
 * @file debug.hpp
 * @brief Logging and tracing for the transfer bridge
 *
 * Every record carries the trace context of the calling thread: the id of the
 * background work being executed and the transfer handle whose callbacks are
 * running, whichever are known. Worker threads open a work scope, callback
 * paths open a handle scope nested inside it, so one download can be followed
 * from the scheduler through the engine threads.
 *
 * Usage:
 * @code
 * XFER_LOG_WARN(LOG_CAT, "dropping " << phase_name(next));
 * TraceScope trace(TraceContext::for_handle(handle));
 * XFER_SPAN_BUDGET("handler READING", LOG_CAT, std::chrono::milliseconds(100));
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace xfer::common::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

constexpr std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        case LogLevel::OFF:
            return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Level for a case-insensitive name ("warning" and "critical" accepted)
 * @return nullopt for anything else
 */
XFER_API std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LOG CATEGORIES
// ============================================================================

namespace category {
constexpr std::string_view GENERAL   = "general";
constexpr std::string_view REGISTRY  = "registry";
constexpr std::string_view BRIDGE    = "bridge";
constexpr std::string_view UPLOAD    = "upload";
constexpr std::string_view DISPATCH  = "dispatch";
constexpr std::string_view TASK      = "task";
constexpr std::string_view LOADER    = "loader";
constexpr std::string_view SCHEDULER = "scheduler";
constexpr std::string_view CLIENT    = "client";
constexpr std::string_view CONFIG    = "config";
constexpr std::string_view TRANSPORT = "transport";
}  // namespace category

// ============================================================================
// TRACE CONTEXT
// ============================================================================

/**
 * @brief What the calling thread is working on; zero means unknown
 */
struct TraceContext {
    uint64_t work_id = 0;
    uint64_t handle  = 0;

    static constexpr TraceContext for_work(uint64_t id) noexcept { return TraceContext{id, 0}; }
    static constexpr TraceContext for_handle(uint64_t h) noexcept { return TraceContext{0, h}; }

    constexpr bool empty() const noexcept { return work_id == 0 && handle == 0; }

    /// "work=12 handle=3#1", omitting unknown parts
    std::string to_string() const;

    constexpr bool operator==(const TraceContext&) const noexcept = default;
};

/**
 * @brief RAII scope layering @p context over the thread's current one
 *
 * Non-zero fields replace the enclosing values until the scope ends, so a
 * handle scope opened on a worker thread keeps the work id.
 */
class TraceScope {
public:
    explicit TraceScope(TraceContext context) noexcept;
    ~TraceScope();

    TraceScope(const TraceScope&)            = delete;
    TraceScope& operator=(const TraceScope&) = delete;

    static TraceContext current() noexcept;

private:
    TraceContext previous_;
};

// ============================================================================
// LOG RECORD AND SINKS
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
    TraceContext trace;
    uint64_t thread_id = 0;
    std::string_view thread_name;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;

    virtual bool is_ready() const noexcept = 0;
};

/**
 * @brief stdout sink; colours only when stdout is a terminal
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool use_colors        = true;
        bool include_timestamp = true;
        bool include_thread_id = true;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * @brief Appending file sink; rotates to path.1 .. path.N past max_file_size
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string file_path;
        size_t max_file_size = 10 * 1024 * 1024;
        uint32_t max_files   = 5;
    };

    explicit FileSink(Config config);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// LOGGER
// ============================================================================

class Logger {
public:
    static Logger& instance() noexcept;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void remove_sink(const std::shared_ptr<ILogSink>& sink);
    void clear_sinks();
    size_t sink_count() const;

    void set_level(LogLevel level) noexcept { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const noexcept { return level_.load(std::memory_order_relaxed); }

    bool is_enabled(LogLevel level) const noexcept {
        return level != LogLevel::OFF && level >= this->level();
    }

    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = XFER_CURRENT_LOCATION);

    void flush();

    /// Names the calling thread in records and, truncated, for the OS
    static void set_thread_name(std::string_view name);
    static std::string_view get_thread_name() noexcept;

private:
    Logger();
    ~Logger();

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

// ============================================================================
// SPAN
// ============================================================================

/**
 * @brief Times a scope
 *
 * Logs the duration at TRACE on exit, or at WARN when a non-zero budget was
 * exceeded. Host and engine threads must not be held up by callbacks, so
 * callback paths run under a budget.
 */
class Span {
public:
    Span(std::string_view name, std::string_view category,
         std::chrono::microseconds budget = std::chrono::microseconds::zero()) noexcept;
    ~Span();

    Span(const Span&)            = delete;
    Span& operator=(const Span&) = delete;

    std::chrono::microseconds elapsed() const noexcept;

private:
    std::string_view name_;
    std::string_view category_;
    std::chrono::microseconds budget_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define XFER_LOG_IMPL(level, category, ...)                                                    \
    do {                                                                                       \
        auto& _xfer_logger = ::xfer::common::debug::Logger::instance();                        \
        if (_xfer_logger.is_enabled(::xfer::common::debug::LogLevel::level)) {                 \
            std::ostringstream _xfer_oss;                                                      \
            _xfer_oss << __VA_ARGS__;                                                          \
            _xfer_logger.log(::xfer::common::debug::LogLevel::level, category, _xfer_oss.str(), \
                             XFER_CURRENT_LOCATION);                                           \
        }                                                                                      \
    } while (0)

#define XFER_LOG_TRACE(cat, ...) XFER_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define XFER_LOG_DEBUG(cat, ...) XFER_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define XFER_LOG_INFO(cat, ...)  XFER_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define XFER_LOG_WARN(cat, ...)  XFER_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define XFER_LOG_ERROR(cat, ...) XFER_LOG_IMPL(ERROR, cat, __VA_ARGS__)

#define XFER_CONCAT_IMPL(a, b) a##b
#define XFER_CONCAT(a, b)      XFER_CONCAT_IMPL(a, b)

#define XFER_SPAN_CAT(name, cat) \
    ::xfer::common::debug::Span XFER_CONCAT(_xfer_span_, __LINE__)(name, cat)

#define XFER_SPAN_BUDGET(name, cat, budget) \
    ::xfer::common::debug::Span XFER_CONCAT(_xfer_span_, __LINE__)(name, cat, budget)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Set the level; a valid XFER_LOG_LEVEL in the environment overrides it
 */
XFER_API void init_logging(LogLevel level = LogLevel::INFO);

}  // namespace xfer::common::debug
