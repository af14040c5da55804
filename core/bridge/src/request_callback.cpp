#include <xfer/bridge/callback_dispatcher.hpp>
#include <xfer/bridge/request_callback.hpp>
#include <xfer/common/debug.hpp>

#include <exception>
#include <mutex>
#include <utility>

namespace xfer::bridge {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::BRIDGE;
}  // namespace

RequestCallbackBridge::RequestCallbackBridge(RequestRegistry& registry,
                                             TransferHandle handle) noexcept
    : registry_(&registry), handle_(handle) {}

RequestCallbackBridge::RequestCallbackBridge(CallbackDispatcher& dispatcher,
                                             TransferHandle handle) noexcept
    : registry_(&dispatcher.registry()), dispatcher_(&dispatcher), handle_(handle) {}

common::Result<void> RequestCallbackBridge::advance(CallbackPhase next) noexcept {
    CallbackPhase current = phase_.load(std::memory_order_acquire);
    do {
        if (!is_valid_transition(current, next)) {
            violations_.fetch_add(1, std::memory_order_relaxed);
            if (is_terminal(current) && is_terminal(next)) {
                XFER_LOG_WARN(LOG_CAT, "dropping " << phase_name(next) << " for handle "
                                                   << handle_to_string(handle_)
                                                   << ": request already " << phase_name(current));
            } else {
                XFER_LOG_WARN(LOG_CAT, "protocol violation on handle "
                                           << handle_to_string(handle_) << ": "
                                           << phase_name(next) << " after "
                                           << phase_name(current));
            }
            return common::err(common::ErrorCode::PROTOCOL_VIOLATION,
                               std::string(phase_name(next)) + " not allowed after " +
                                   std::string(phase_name(current)));
        }
    } while (!phase_.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                           std::memory_order_acquire));
    return common::ok();
}

template <typename Fn>
common::Result<void> RequestCallbackBridge::forward(CallbackPhase phase, Fn&& call) noexcept {
    try {
        auto handler = registry_->lookup(handle_);
        if (handler.is_error()) {
            lookup_failures_.fetch_add(1, std::memory_order_relaxed);
            XFER_LOG_WARN(LOG_CAT, "cannot forward " << phase_name(phase) << ": "
                                                     << handler.message());
            return handler.error();
        }
        {
            XFER_SPAN_BUDGET(phase_name(phase), LOG_CAT, HANDLER_TIME_BUDGET);
            call(*handler.value());
        }
        forwarded_.fetch_add(1, std::memory_order_relaxed);
        XFER_LOG_TRACE(LOG_CAT, "forwarded " << phase_name(phase) << " for handle "
                                             << handle_to_string(handle_));
        return common::ok();
    } catch (const std::exception& e) {
        handler_failures_.fetch_add(1, std::memory_order_relaxed);
        XFER_LOG_ERROR(LOG_CAT, "handler for " << handle_to_string(handle_) << " threw in "
                                               << phase_name(phase) << ": " << e.what());
        return common::err(common::ErrorCode::CALLBACK_FAILED, e.what());
    } catch (...) {
        handler_failures_.fetch_add(1, std::memory_order_relaxed);
        XFER_LOG_ERROR(LOG_CAT, "handler for " << handle_to_string(handle_)
                                               << " threw a non-standard exception in "
                                               << phase_name(phase));
        return common::err(common::ErrorCode::CALLBACK_FAILED, "non-standard exception");
    }
}

namespace {

template <typename Build>
common::Result<void> post_message(CallbackDispatcher& dispatcher, Build&& build) noexcept {
    try {
        return dispatcher.post(build());
    } catch (const std::exception& e) {
        XFER_LOG_ERROR(LOG_CAT, "cannot queue phase message: " << e.what());
        return common::err(common::ErrorCode::RESOURCE_EXHAUSTED, e.what());
    } catch (...) {
        XFER_LOG_ERROR(LOG_CAT, "cannot queue phase message: non-standard exception");
        return common::err(common::ErrorCode::RESOURCE_EXHAUSTED, "non-standard exception");
    }
}

}  // namespace

template <typename Build, typename Call>
common::Result<void> RequestCallbackBridge::deliver(CallbackPhase next, Build&& build,
                                                    Call&& call) noexcept {
    std::lock_guard lock(deliver_mutex_);
    common::debug::TraceScope trace(common::debug::TraceContext::for_handle(handle_));

    const CallbackPhase previous = phase();
    XFER_TRY(advance(next));

    if (dispatcher_) {
        auto posted = post_message(*dispatcher_, build);
        if (posted.is_success()) {
            return posted;
        }
        if (posted.code() != common::ErrorCode::INVALID_STATE) {
            // Not queued: the host may retry the same phase
            phase_.store(previous, std::memory_order_release);
            XFER_LOG_WARN(LOG_CAT, "could not queue " << phase_name(next) << " for handle "
                                                      << handle_to_string(handle_) << ", staying "
                                                      << phase_name(previous));
            return posted;
        }
        drain_dispatcher(next);
    }

    auto result = forward(next, call);
    if (is_terminal(next)) {
        finish();
    }
    return result;
}

void RequestCallbackBridge::drain_dispatcher(CallbackPhase next) noexcept {
    XFER_LOG_DEBUG(LOG_CAT, "dispatcher not running, delivering " << phase_name(next)
                                                                  << " for handle "
                                                                  << handle_to_string(handle_)
                                                                  << " on the calling thread");
    try {
        // Earlier phases still queued for this handle go first
        if (!dispatcher_->wait_idle(dispatcher_->config().enqueue_timeout)) {
            XFER_LOG_WARN(LOG_CAT, "dispatcher still draining when handle "
                                       << handle_to_string(handle_) << " delivered "
                                       << phase_name(next));
        }
    } catch (const std::exception& e) {
        XFER_LOG_WARN(LOG_CAT, "waiting for dispatcher failed: " << e.what());
    }
}

common::Result<void> RequestCallbackBridge::on_redirect_received(
    const ResponseInfo& info, const std::string& new_location) noexcept {
    return deliver(
        CallbackPhase::REDIRECT_RECEIVED,
        [&] {
            PhaseMessage msg;
            msg.handle       = handle_;
            msg.phase        = CallbackPhase::REDIRECT_RECEIVED;
            msg.info         = info;
            msg.new_location = new_location;
            return msg;
        },
        [&](IRequestHandler& handler) { handler.on_redirect_received(info, new_location); });
}

common::Result<void> RequestCallbackBridge::on_response_started(const ResponseInfo& info) noexcept {
    return deliver(
        CallbackPhase::RESPONSE_STARTED,
        [&] {
            PhaseMessage msg;
            msg.handle = handle_;
            msg.phase  = CallbackPhase::RESPONSE_STARTED;
            msg.info   = info;
            return msg;
        },
        [&](IRequestHandler& handler) { handler.on_response_started(info); });
}

common::Result<void> RequestCallbackBridge::on_read_completed(
    const ResponseInfo& info, std::span<const uint8_t> chunk) noexcept {
    return deliver(
        CallbackPhase::READING,
        [&] {
            PhaseMessage msg;
            msg.handle = handle_;
            msg.phase  = CallbackPhase::READING;
            msg.info   = info;
            msg.chunk.assign(chunk.begin(), chunk.end());
            return msg;
        },
        [&](IRequestHandler& handler) { handler.on_read_completed(info, chunk); });
}

common::Result<void> RequestCallbackBridge::on_succeeded(const ResponseInfo& info) noexcept {
    return deliver(
        CallbackPhase::SUCCEEDED,
        [&] {
            PhaseMessage msg;
            msg.handle = handle_;
            msg.phase  = CallbackPhase::SUCCEEDED;
            msg.info   = info;
            return msg;
        },
        [&](IRequestHandler& handler) { handler.on_succeeded(info); });
}

common::Result<void> RequestCallbackBridge::on_failed(const ResponseInfo* info,
                                                      const RequestError& error) noexcept {
    return deliver(
        CallbackPhase::FAILED,
        [&] {
            PhaseMessage msg;
            msg.handle = handle_;
            msg.phase  = CallbackPhase::FAILED;
            if (info) {
                msg.info = *info;
            }
            msg.error = error;
            return msg;
        },
        [&](IRequestHandler& handler) { handler.on_failed(info, error); });
}

void RequestCallbackBridge::finish() noexcept {
    if (registry_->retire(handle_)) {
        XFER_LOG_DEBUG(LOG_CAT, "request " << handle_to_string(handle_) << " finished as "
                                           << phase_name(phase()));
    }
}

BridgeStats RequestCallbackBridge::stats() const noexcept {
    BridgeStats s;
    s.forwarded           = forwarded_.load(std::memory_order_relaxed);
    s.protocol_violations = violations_.load(std::memory_order_relaxed);
    s.handler_failures    = handler_failures_.load(std::memory_order_relaxed);
    s.lookup_failures     = lookup_failures_.load(std::memory_order_relaxed);
    return s;
}

}  // namespace xfer::bridge
