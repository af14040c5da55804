#include <xfer/common/debug.hpp>
#include <xfer/common/platform.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace xfer::common::debug {

namespace {

struct ThreadState {
    TraceContext trace;
    std::string name;
};

ThreadState& thread_state() {
    static thread_local ThreadState state;
    return state;
}

void write_timestamp(std::ostream& out, std::chrono::system_clock::time_point ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count() << std::setfill(' ');
}

// Prefix shared by both sinks after the timestamp and level
void write_context(std::ostream& out, const LogRecord& record, bool with_thread) {
    if (!record.category.empty()) {
        out << '[' << record.category << "] ";
    }
    if (with_thread) {
        out << "[T:" << record.thread_id;
        if (!record.thread_name.empty()) {
            out << ' ' << record.thread_name;
        }
        out << "] ";
    }
    if (!record.trace.empty()) {
        out << '[' << record.trace.to_string() << "] ";
    }
}

}  // anonymous namespace

// ============================================================================
// Log Level Parsing
// ============================================================================

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR")
        return LogLevel::ERROR;
    if (upper == "FATAL" || upper == "CRITICAL")
        return LogLevel::FATAL;
    if (upper == "OFF")
        return LogLevel::OFF;
    return std::nullopt;
}

// ============================================================================
// TraceContext / TraceScope
// ============================================================================

std::string TraceContext::to_string() const {
    std::ostringstream oss;
    if (work_id != 0) {
        oss << "work=" << work_id;
    }
    if (handle != 0) {
        if (work_id != 0) {
            oss << ' ';
        }
        // slot in the low 32 bits, generation above
        oss << "handle=" << (handle & 0xFFFFFFFFu) << '#' << ((handle >> 32) & 0x7FFFFFFFu);
    }
    return oss.str();
}

TraceScope::TraceScope(TraceContext context) noexcept : previous_(thread_state().trace) {
    auto& trace = thread_state().trace;
    if (context.work_id != 0) {
        trace.work_id = context.work_id;
    }
    if (context.handle != 0) {
        trace.handle = context.handle;
    }
}

TraceScope::~TraceScope() {
    thread_state().trace = previous_;
}

TraceContext TraceScope::current() noexcept {
    return thread_state().trace;
}

// ============================================================================
// ConsoleSink
// ============================================================================

namespace {

constexpr const char* RESET = "\033[0m";

constexpr const char* color_for_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "\033[90m";
        case LogLevel::DEBUG:
            return "\033[36m";
        case LogLevel::INFO:
            return "\033[32m";
        case LogLevel::WARN:
            return "\033[33m";
        case LogLevel::ERROR:
            return "\033[31m";
        case LogLevel::FATAL:
            return "\033[35m";
        default:
            return "";
    }
}

}  // anonymous namespace

ConsoleSink::ConsoleSink() : ConsoleSink(Config{}) {}

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {
    if (config_.use_colors) {
        config_.use_colors = isatty(fileno(stdout)) != 0;
    }
}

ConsoleSink::~ConsoleSink() {
    flush();
}

void ConsoleSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostream& out = std::cout;
    if (config_.include_timestamp) {
        write_timestamp(out, record.timestamp);
        out << ' ';
    }
    if (config_.use_colors) {
        out << color_for_level(record.level);
    }
    out << std::left << std::setw(5) << level_name(record.level) << std::right;
    if (config_.use_colors) {
        out << RESET;
    }
    out << ' ';
    write_context(out, record, config_.include_thread_id);
    out << record.message << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

// ============================================================================
// FileSink
// ============================================================================

struct FileSink::Impl {
    Config config;
    std::ofstream file;
    std::mutex mutex;
    size_t current_size = 0;

    bool open() {
        file.open(config.file_path, std::ios::app);
        if (!file.is_open()) {
            return false;
        }
        file.seekp(0, std::ios::end);
        current_size = static_cast<size_t>(file.tellp());
        return true;
    }

    // path.N-1 -> path.N ... path -> path.1; the oldest falls off
    void rotate() {
        file.close();
        std::string oldest = config.file_path + "." + std::to_string(config.max_files);
        std::remove(oldest.c_str());
        for (uint32_t i = config.max_files; i > 1; --i) {
            std::string from = config.file_path + "." + std::to_string(i - 1);
            std::string to   = config.file_path + "." + std::to_string(i);
            std::rename(from.c_str(), to.c_str());
        }
        if (config.max_files > 0) {
            std::rename(config.file_path.c_str(), (config.file_path + ".1").c_str());
        } else {
            std::remove(config.file_path.c_str());
        }
        current_size = 0;
        open();
    }
};

FileSink::FileSink(Config config) : impl_(std::make_unique<Impl>()) {
    impl_->config = std::move(config);
    if (!impl_->open()) {
        std::cerr << "xfer: cannot open log file " << impl_->config.file_path << '\n';
    }
}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    std::ostringstream oss;
    write_timestamp(oss, record.timestamp);
    oss << ' ' << level_name(record.level) << ' ';
    write_context(oss, record, true);
    oss << record.message;
    if (record.location.is_valid()) {
        oss << " (" << record.location.file << ':' << record.location.line << ')';
    }
    oss << '\n';
    std::string line = oss.str();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->file.is_open()) {
        return;
    }
    impl_->file << line;
    impl_->current_size += line.size();
    if (impl_->config.max_file_size > 0 && impl_->current_size >= impl_->config.max_file_size) {
        impl_->rotate();
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->file.is_open()) {
        impl_->file.flush();
    }
}

bool FileSink::is_ready() const noexcept {
    return impl_->file.is_open();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

size_t Logger::sink_count() const {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    return sinks_.size();
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 SourceLocation loc) {
    if (!is_enabled(level)) {
        return;
    }

    LogRecord record;
    record.level       = level;
    record.category    = category;
    record.message     = std::move(message);
    record.location    = loc;
    record.timestamp   = std::chrono::system_clock::now();
    record.trace       = TraceScope::current();
    record.thread_id   = platform::get_thread_id();
    record.thread_name = get_thread_name();

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink && sink->is_ready()) {
            sink->write(record);
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

void Logger::set_thread_name(std::string_view name) {
    thread_state().name = std::string(name);
    platform::set_thread_name(name);
}

std::string_view Logger::get_thread_name() noexcept {
    return thread_state().name;
}

// ============================================================================
// Span
// ============================================================================

Span::Span(std::string_view name, std::string_view category,
           std::chrono::microseconds budget) noexcept
    : name_(name), category_(category), budget_(budget),
      start_(std::chrono::steady_clock::now()) {}

Span::~Span() {
    auto us = elapsed();
    if (budget_.count() > 0 && us > budget_) {
        XFER_LOG_WARN(category_, name_ << " took " << us.count() << "us, budget "
                                       << budget_.count() << "us");
    } else {
        XFER_LOG_TRACE(category_, name_ << " took " << us.count() << "us");
    }
}

std::chrono::microseconds Span::elapsed() const noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                                 start_);
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(LogLevel level) {
    Logger::instance().set_level(level);

    auto env_level = parse_log_level(platform::get_env("XFER_LOG_LEVEL"));
    if (env_level) {
        Logger::instance().set_level(*env_level);
    }
}

}  // namespace xfer::common::debug
