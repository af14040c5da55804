/**
 * @file xfer_test_support.hpp
 * @brief Shared test doubles for the transfer bridge unit tests
 *
 * Provides:
 * - RecordingEngine: scriptable ITransferEngine
 * - RecordingRequestHandler: IRequestHandler recording every phase
 * - RecordingUploadSink: IUploadDataSink that can reject acknowledgments
 * - RecordingProgressListener / RecordingPromoter
 * - TempDir, LogCapture, TestLatch and wait_for()
 *
 * Usage:
 *   #include <xfer_test_support.hpp>
 *
 *   TEST(TransferTaskTest, Succeeds) {
 *       xfer::test::RecordingEngine engine;
 *       engine.set_result(0);
 *       ...
 *   }
 */

#pragma once

#include <xfer/bridge/callback_phase.hpp>
#include <xfer/bridge/progress.hpp>
#include <xfer/bridge/request_handler.hpp>
#include <xfer/bridge/upload_provider.hpp>
#include <xfer/common/debug.hpp>
#include <xfer/common/error.hpp>
#include <xfer/task/engine.hpp>
#include <xfer/task/foreground.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace xfer::test {

// ============================================================================
// Async Testing Utilities
// ============================================================================

/**
 * @brief Synchronization primitive for async tests
 */
class TestLatch {
public:
    explicit TestLatch(int count = 1) : count_(count) {}

    void count_down() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ > 0 && --count_ == 0) {
            cv_.notify_all();
        }
    }

    bool wait(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return count_ == 0; });
    }

    bool is_released() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ == 0;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int count_;
};

/**
 * @brief Wait for condition with timeout
 */
template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// ============================================================================
// Transfer Engine
// ============================================================================

/**
 * @brief Engine double: records requests and cancel hints, returns a scripted result
 */
class RecordingEngine : public task::ITransferEngine {
public:
    int32_t submit(const task::TransferRequest& request,
                   bridge::IProgressCallback* progress) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            had_progress_.push_back(progress != nullptr);
        }
        submit_count_.fetch_add(1);

        if (throw_message_) {
            throw std::runtime_error(*throw_message_);
        }
        if (throw_value_) {
            throw *throw_value_;
        }
        if (on_submit_) {
            on_submit_();
        }

        if (progress != nullptr) {
            for (const auto& [bytes, total] : progress_steps_) {
                progress->on_progress(bytes, total);
            }
        }

        if (block_until_cancelled_) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, block_timeout_, [this] { return !cancelled_.empty(); });
        }
        return result_;
    }

    void cancel(bridge::TransferHandle handle) noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.push_back(handle);
        }
        cv_.notify_all();
    }

    // Scripting
    void set_result(int32_t result) { result_ = result; }
    void set_throw(std::string message) { throw_message_ = std::move(message); }
    /// Throw a plain int, which does not derive from std::exception
    void set_throw_value(int value) { throw_value_ = value; }
    /// Run @p hook inside submit() before the result is returned
    void set_on_submit(std::function<void()> hook) { on_submit_ = std::move(hook); }
    void set_progress_steps(std::vector<std::pair<int64_t, int64_t>> steps) {
        progress_steps_ = std::move(steps);
    }
    void set_block_until_cancelled(bool block,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        block_until_cancelled_ = block;
        block_timeout_         = timeout;
    }

    // Inspection
    size_t submit_count() const { return submit_count_.load(); }

    std::vector<task::TransferRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    task::TransferRequest last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.empty() ? task::TransferRequest{} : requests_.back();
    }

    bool last_had_progress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !had_progress_.empty() && had_progress_.back();
    }

    std::vector<bridge::TransferHandle> cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    int32_t result_ = task::ENGINE_SUCCESS;
    std::optional<std::string> throw_message_;
    std::optional<int> throw_value_;
    std::function<void()> on_submit_;
    std::vector<std::pair<int64_t, int64_t>> progress_steps_;
    bool block_until_cancelled_ = false;
    std::chrono::milliseconds block_timeout_{5000};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<task::TransferRequest> requests_;
    std::vector<bool> had_progress_;
    std::vector<bridge::TransferHandle> cancelled_;
    std::atomic<size_t> submit_count_{0};
};

// ============================================================================
// Progress
// ============================================================================

class RecordingProgressListener : public bridge::IProgressListener {
public:
    using Event = std::pair<uint64_t, std::optional<uint64_t>>;

    void on_progress(uint64_t bytes, std::optional<uint64_t> total) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.emplace_back(bytes, total);
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

// ============================================================================
// Foreground
// ============================================================================

class RecordingPromoter : public task::IForegroundPromoter {
public:
    common::Result<void> set_foreground(const task::ForegroundInfo& info) override {
        calls_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_info_ = info;
        }
        if (throw_message_) {
            throw std::runtime_error(*throw_message_);
        }
        if (fail_) {
            return common::err(common::ErrorCode::PLATFORM_ERROR, "promotion refused");
        }
        return common::ok();
    }

    void set_fail(bool fail) { fail_ = fail; }
    void set_throw(std::string message) { throw_message_ = std::move(message); }

    size_t calls() const { return calls_.load(); }

    task::ForegroundInfo last_info() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_info_;
    }

private:
    bool fail_ = false;
    std::optional<std::string> throw_message_;
    std::atomic<size_t> calls_{0};
    mutable std::mutex mutex_;
    task::ForegroundInfo last_info_;
};

// ============================================================================
// Request Handler
// ============================================================================

/**
 * @brief Engine-side handler recording each phase it receives
 */
class RecordingRequestHandler : public bridge::IRequestHandler {
public:
    struct Event {
        bridge::CallbackPhase phase = bridge::CallbackPhase::CREATED;
        bool has_info               = false;
        int status                  = 0;
        std::string url;
        std::string location;
        std::vector<uint8_t> bytes;
        std::optional<bridge::RequestError> error;
    };

    void on_redirect_received(const bridge::ResponseInfo& info,
                              const std::string& new_location) override {
        Event event = make(bridge::CallbackPhase::REDIRECT_RECEIVED, &info);
        event.location = new_location;
        record(std::move(event));
    }

    void on_response_started(const bridge::ResponseInfo& info) override {
        record(make(bridge::CallbackPhase::RESPONSE_STARTED, &info));
    }

    void on_read_completed(const bridge::ResponseInfo& info,
                           std::span<const uint8_t> chunk) override {
        Event event = make(bridge::CallbackPhase::READING, &info);
        event.bytes.assign(chunk.begin(), chunk.end());
        record(std::move(event));
    }

    void on_succeeded(const bridge::ResponseInfo& info) override {
        record(make(bridge::CallbackPhase::SUCCEEDED, &info));
    }

    void on_failed(const bridge::ResponseInfo* info, const bridge::RequestError& error) override {
        Event event = make(bridge::CallbackPhase::FAILED, info);
        event.error = error;
        record(std::move(event));
    }

    /// Throw from the handler method of @p phase (after recording it)
    void throw_in(bridge::CallbackPhase phase) { throw_phase_ = phase; }

    /// Like throw_in() but throws a plain int
    void throw_value_in(bridge::CallbackPhase phase) {
        throw_phase_ = phase;
        throw_value_ = true;
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<bridge::CallbackPhase> phases() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<bridge::CallbackPhase> result;
        for (const auto& event : events_) {
            result.push_back(event.phase);
        }
        return result;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    size_t terminal_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& event : events_) {
            if (bridge::is_terminal(event.phase)) {
                ++n;
            }
        }
        return n;
    }

    std::vector<uint8_t> body() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<uint8_t> result;
        for (const auto& event : events_) {
            result.insert(result.end(), event.bytes.begin(), event.bytes.end());
        }
        return result;
    }

private:
    static Event make(bridge::CallbackPhase phase, const bridge::ResponseInfo* info) {
        Event event;
        event.phase    = phase;
        event.has_info = info != nullptr;
        if (info != nullptr) {
            event.status = info->http_status_code;
            event.url    = info->url;
        }
        return event;
    }

    void record(Event event) {
        const bridge::CallbackPhase phase = event.phase;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        if (throw_phase_ && *throw_phase_ == phase) {
            if (throw_value_) {
                throw static_cast<int>(phase);
            }
            throw std::runtime_error("handler failure in " + std::string(bridge::phase_name(phase)));
        }
    }

    std::optional<bridge::CallbackPhase> throw_phase_;
    bool throw_value_ = false;
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

// ============================================================================
// Upload Sink
// ============================================================================

/**
 * @brief Host acknowledgment channel double
 */
class RecordingUploadSink : public bridge::IUploadDataSink {
public:
    void on_read_succeeded(size_t bytes_read, bool final_chunk) override {
        read_sizes.push_back(bytes_read);
        final_flags.push_back(final_chunk);
        if (reject_reads) {
            reject("read acknowledgment rejected");
        }
    }

    void on_read_error(const common::Error& error) override {
        read_errors.push_back(error);
        if (reject_errors) {
            reject("read error report rejected");
        }
    }

    void on_rewind_succeeded() override {
        ++rewinds;
        if (reject_rewinds) {
            reject("rewind acknowledgment rejected");
        }
    }

    void on_rewind_error(const common::Error& error) override {
        rewind_errors.push_back(error);
        if (reject_errors) {
            reject("rewind error report rejected");
        }
    }

    bool reject_reads   = false;
    bool reject_rewinds = false;
    bool reject_errors  = false;
    /// Reject by throwing a plain int instead of std::runtime_error
    bool reject_with_int = false;

    std::vector<size_t> read_sizes;
    std::vector<bool> final_flags;
    std::vector<common::Error> read_errors;
    std::vector<common::Error> rewind_errors;
    size_t rewinds = 0;

private:
    void reject(const char* message) const {
        if (reject_with_int) {
            throw 7;
        }
        throw std::runtime_error(message);
    }
};

// ============================================================================
// Files
// ============================================================================

/**
 * @brief Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("xfer-test-" + std::to_string(rng()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path file(const std::string& name) const { return path_ / name; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto target = file(name);
        std::ofstream out(target, std::ios::binary);
        out << content;
        return target;
    }

    static std::string read(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

private:
    std::filesystem::path path_;
};

// ============================================================================
// Logging
// ============================================================================

/**
 * @brief Captures log records for the lifetime of the object
 */
class LogCapture {
public:
    struct Entry {
        common::debug::LogLevel level;
        std::string category;
        std::string message;
        common::debug::TraceContext trace;
        std::string thread_name;
    };

    explicit LogCapture(common::debug::LogLevel level = common::debug::LogLevel::DEBUG)
        : previous_level_(common::debug::Logger::instance().level()),
          sink_(std::make_shared<Sink>(*this)) {
        common::debug::Logger::instance().set_level(level);
        common::debug::Logger::instance().add_sink(sink_);
    }

    ~LogCapture() {
        common::debug::Logger::instance().remove_sink(sink_);
        common::debug::Logger::instance().set_level(previous_level_);
    }

    LogCapture(const LogCapture&)            = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t count(common::debug::LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& entry : entries_) {
            if (entry.level == level) {
                ++n;
            }
        }
        return n;
    }

    bool contains(const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    bool contains(common::debug::LogLevel level, const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.level == level && entry.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    class Sink : public common::debug::ILogSink {
    public:
        explicit Sink(LogCapture& owner) : owner_(owner) {}

        void write(const common::debug::LogRecord& record) override {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.entries_.push_back(Entry{record.level, std::string(record.category),
                                            record.message, record.trace,
                                            std::string(record.thread_name)});
        }
        void flush() override {}
        bool is_ready() const noexcept override { return true; }

    private:
        LogCapture& owner_;
    };

    common::debug::LogLevel previous_level_;
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::shared_ptr<Sink> sink_;
};

// ============================================================================
// Test Assertions for Result
// ============================================================================

#define ASSERT_RESULT_OK(result) \
    ASSERT_TRUE((result).is_success()) << "Expected success, got error: " << (result).error().to_string()

#define EXPECT_RESULT_OK(result) \
    EXPECT_TRUE((result).is_success()) << "Expected success, got error: " << (result).error().to_string()

#define EXPECT_RESULT_ERROR(result, expected_code)                                        \
    do {                                                                                  \
        auto&& _xfer_r = (result);                                                        \
        EXPECT_TRUE(_xfer_r.is_error()) << "Expected error, got success";                 \
        EXPECT_EQ(_xfer_r.code(), (expected_code))                                        \
            << "got " << ::xfer::common::error_name(_xfer_r.code()) << ": " << _xfer_r.message(); \
    } while (0)

}  // namespace xfer::test
