#include <xfer/bridge/callback_dispatcher.hpp>
#include <xfer/common/debug.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace xfer::bridge {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::DISPATCH;
}  // namespace

class CallbackDispatcher::Impl {
public:
    Impl(RequestRegistry& registry, DispatcherConfig config)
        : registry_(registry), config_(config) {
        if (config_.queue_capacity == 0) {
            config_.queue_capacity = DispatcherConfig{}.queue_capacity;
        }
    }

    ~Impl() { stop(); }

    bool start() {
        XFER_SPAN_CAT("CallbackDispatcher::start", LOG_CAT);

        std::lock_guard lock(mutex_);
        if (running_) {
            XFER_LOG_WARN(LOG_CAT, "CallbackDispatcher already running");
            return false;
        }
        running_        = true;
        stop_requested_ = false;
        worker_         = std::thread([this]() { dispatch_loop(); });

        XFER_LOG_INFO(LOG_CAT, "CallbackDispatcher started (capacity "
                                   << config_.queue_capacity << ")");
        return true;
    }

    void stop() {
        {
            std::lock_guard lock(mutex_);
            if (!running_) {
                return;
            }
            stop_requested_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();

        if (worker_.joinable()) {
            worker_.join();
        }

        std::lock_guard lock(mutex_);
        running_ = false;
        XFER_LOG_INFO(LOG_CAT, "CallbackDispatcher stopped after " << delivered_ << " messages");
    }

    bool is_running() const noexcept {
        std::lock_guard lock(mutex_);
        return running_ && !stop_requested_;
    }

    common::Result<void> post(PhaseMessage message) noexcept {
        std::unique_lock lock(mutex_);
        if (!running_ || stop_requested_) {
            return common::err(common::ErrorCode::INVALID_STATE, "dispatcher is not running");
        }

        bool has_room = not_full_.wait_for(lock, config_.enqueue_timeout, [this]() {
            return queue_.size() < config_.queue_capacity || stop_requested_;
        });
        if (!has_room || stop_requested_) {
            ++rejected_full_;
            XFER_LOG_WARN(LOG_CAT, "queue full, rejecting " << phase_name(message.phase)
                                                            << " for handle "
                                                            << handle_to_string(message.handle));
            return common::err(common::ErrorCode::QUEUE_FULL, "phase queue full");
        }

        queue_.push_back(std::move(message));
        ++posted_;
        lock.unlock();
        not_empty_.notify_one();
        return common::ok();
    }

    bool wait_idle(std::chrono::milliseconds timeout) const {
        std::unique_lock lock(mutex_);
        return idle_.wait_for(lock, timeout, [this]() { return queue_.empty() && !busy_; });
    }

    DispatcherStats stats() const noexcept {
        std::lock_guard lock(mutex_);
        DispatcherStats s;
        s.posted              = posted_;
        s.delivered           = delivered_;
        s.rejected_full       = rejected_full_;
        s.protocol_violations = violations_;
        s.lookup_failures     = lookup_failures_;
        s.handler_failures    = handler_failures_;
        s.queue_size          = queue_.size();
        s.tracked_handles     = tracked_handles_;
        return s;
    }

    RequestRegistry& registry() noexcept { return registry_; }
    const DispatcherConfig& config() const noexcept { return config_; }

private:
    void dispatch_loop() {
        common::debug::Logger::set_thread_name("xfer-dispatch");
        XFER_LOG_DEBUG(LOG_CAT, "dispatcher thread started");

        while (true) {
            PhaseMessage message;
            {
                std::unique_lock lock(mutex_);
                not_empty_.wait(lock, [this]() { return stop_requested_ || !queue_.empty(); });
                if (queue_.empty()) {
                    // stop requested and everything delivered
                    break;
                }
                message = std::move(queue_.front());
                queue_.pop_front();
                busy_ = true;
            }
            not_full_.notify_one();

            deliver(message);
            update_tracked();

            {
                std::lock_guard lock(mutex_);
                busy_ = false;
                if (queue_.empty()) {
                    idle_.notify_all();
                }
            }
        }

        idle_.notify_all();
        XFER_LOG_DEBUG(LOG_CAT, "dispatcher thread stopped");
    }

    // Runs on the dispatcher thread only; phases_ needs no lock
    void deliver(const PhaseMessage& message) {
        common::debug::TraceScope trace(common::debug::TraceContext::for_handle(message.handle));
        auto it = phases_.find(message.handle);
        CallbackPhase current = it == phases_.end() ? CallbackPhase::CREATED : it->second;

        if (!is_valid_transition(current, message.phase)) {
            count(violations_);
            XFER_LOG_WARN(LOG_CAT, "dropping " << phase_name(message.phase) << " for handle "
                                               << handle_to_string(message.handle) << " after "
                                               << phase_name(current));
            return;
        }
        phases_[message.handle] = message.phase;
        if (phases_.size() > sweep_threshold()) {
            sweep_abandoned();
        }

        try {
            auto handler = registry_.lookup(message.handle);
            if (handler.is_error()) {
                count(lookup_failures_);
                XFER_LOG_WARN(LOG_CAT, "cannot deliver " << phase_name(message.phase) << ": "
                                                         << handler.message());
            } else {
                {
                    XFER_SPAN_BUDGET(phase_name(message.phase), LOG_CAT, HANDLER_TIME_BUDGET);
                    invoke(*handler.value(), message);
                }
                count(delivered_);
            }
        } catch (const std::exception& e) {
            count(handler_failures_);
            XFER_LOG_ERROR(LOG_CAT, "handler for " << handle_to_string(message.handle)
                                                   << " threw in " << phase_name(message.phase)
                                                   << ": " << e.what());
        } catch (...) {
            count(handler_failures_);
            XFER_LOG_ERROR(LOG_CAT, "handler for " << handle_to_string(message.handle)
                                                   << " threw a non-standard exception in "
                                                   << phase_name(message.phase));
        }

        if (is_terminal(message.phase)) {
            registry_.retire(message.handle);
            remember_terminal(message.handle);
        }
    }

    static void invoke(IRequestHandler& handler, const PhaseMessage& message) {
        static const ResponseInfo empty_info;
        const ResponseInfo& info = message.info ? *message.info : empty_info;

        switch (message.phase) {
            case CallbackPhase::REDIRECT_RECEIVED:
                handler.on_redirect_received(info, message.new_location);
                break;
            case CallbackPhase::RESPONSE_STARTED:
                handler.on_response_started(info);
                break;
            case CallbackPhase::READING:
                handler.on_read_completed(info, message.chunk);
                break;
            case CallbackPhase::SUCCEEDED:
                handler.on_succeeded(info);
                break;
            case CallbackPhase::FAILED:
                handler.on_failed(message.info ? &*message.info : nullptr, message.error);
                break;
            case CallbackPhase::CREATED:
                break;
        }
    }

    void remember_terminal(TransferHandle handle) {
        terminal_order_.push_back(handle);
        while (terminal_order_.size() > config_.terminal_history) {
            phases_.erase(terminal_order_.front());
            terminal_order_.pop_front();
        }
    }

    size_t sweep_threshold() const noexcept {
        return registry_.capacity() + config_.terminal_history;
    }

    // Handles that left the registry without a terminal phase passing through here
    void sweep_abandoned() {
        size_t removed = 0;
        for (auto it = phases_.begin(); it != phases_.end();) {
            if (!is_terminal(it->second) && !registry_.contains(it->first)) {
                it = phases_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            XFER_LOG_DEBUG(LOG_CAT, "forgot " << removed << " abandoned handles");
        }
    }

    void count(uint64_t& counter) {
        std::lock_guard lock(mutex_);
        ++counter;
    }

    void update_tracked() {
        std::lock_guard lock(mutex_);
        tracked_handles_ = phases_.size();
    }

    RequestRegistry& registry_;
    DispatcherConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    mutable std::condition_variable idle_;
    std::deque<PhaseMessage> queue_;
    std::thread worker_;
    bool running_        = false;
    bool stop_requested_ = false;
    bool busy_           = false;

    uint64_t posted_           = 0;
    uint64_t delivered_        = 0;
    uint64_t rejected_full_    = 0;
    uint64_t violations_       = 0;
    uint64_t lookup_failures_  = 0;
    uint64_t handler_failures_ = 0;
    size_t tracked_handles_    = 0;

    std::unordered_map<TransferHandle, CallbackPhase> phases_;
    std::deque<TransferHandle> terminal_order_;
};

// ============================================================================
// CallbackDispatcher
// ============================================================================

CallbackDispatcher::CallbackDispatcher(RequestRegistry& registry, DispatcherConfig config)
    : impl_(std::make_unique<Impl>(registry, config)) {}

CallbackDispatcher::~CallbackDispatcher() = default;

bool CallbackDispatcher::start() {
    return impl_->start();
}

void CallbackDispatcher::stop() {
    impl_->stop();
}

bool CallbackDispatcher::is_running() const noexcept {
    return impl_->is_running();
}

common::Result<void> CallbackDispatcher::post(PhaseMessage message) noexcept {
    return impl_->post(std::move(message));
}

bool CallbackDispatcher::wait_idle(std::chrono::milliseconds timeout) const {
    return impl_->wait_idle(timeout);
}

DispatcherStats CallbackDispatcher::stats() const noexcept {
    return impl_->stats();
}

RequestRegistry& CallbackDispatcher::registry() noexcept {
    return impl_->registry();
}

const DispatcherConfig& CallbackDispatcher::config() const noexcept {
    return impl_->config();
}

}  // namespace xfer::bridge
