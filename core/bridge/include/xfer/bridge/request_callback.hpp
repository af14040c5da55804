#pragma once

/**
 * @file request_callback.hpp
 * @brief Host-side callback object for one network request
 *
 * The host networking stack drives a RequestCallbackBridge through the five phase
 * methods. Each accepted phase is forwarded to the engine-side IRequestHandler
 * registered under the bridge's handle, either directly on the calling thread or
 * through a CallbackDispatcher. After SUCCEEDED or FAILED the handle is retired.
 *
 * Out-of-order phases and anything after a terminal phase are rejected with
 * PROTOCOL_VIOLATION, logged, and never forwarded. Of two racing terminal
 * notifications exactly one wins. No method throws.
 *
 * Phase methods on one bridge are serialized: a phase is accepted and handed on
 * (forwarded or queued) before the next one is looked at, so a handler never sees
 * READING after SUCCEEDED. Handlers must not call back into their own bridge.
 *
 * In queued mode a phase the dispatcher refuses (QUEUE_FULL) is not accepted and
 * the bridge stays in its previous phase. When the dispatcher is not running the
 * phase is delivered on the calling thread once earlier queued phases drained.
 */

#include <xfer/bridge/callback_phase.hpp>
#include <xfer/bridge/handle.hpp>
#include <xfer/bridge/handle_registry.hpp>
#include <xfer/bridge/request_handler.hpp>
#include <xfer/bridge/request_types.hpp>
#include <xfer/common/error.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>

namespace xfer::bridge {

using RequestRegistry = HandleRegistry<IRequestHandler>;

class CallbackDispatcher;

struct BridgeStats {
    uint64_t forwarded          = 0;
    uint64_t protocol_violations = 0;
    uint64_t handler_failures   = 0;
    uint64_t lookup_failures    = 0;
};

class RequestCallbackBridge {
public:
    /**
     * @brief Forward phases synchronously to the handler registered in @p registry
     */
    RequestCallbackBridge(RequestRegistry& registry, TransferHandle handle) noexcept;

    /**
     * @brief Forward phases as messages through @p dispatcher
     */
    RequestCallbackBridge(CallbackDispatcher& dispatcher, TransferHandle handle) noexcept;

    RequestCallbackBridge(const RequestCallbackBridge&)            = delete;
    RequestCallbackBridge& operator=(const RequestCallbackBridge&) = delete;

    common::Result<void> on_redirect_received(const ResponseInfo& info,
                                              const std::string& new_location) noexcept;

    common::Result<void> on_response_started(const ResponseInfo& info) noexcept;

    common::Result<void> on_read_completed(const ResponseInfo& info,
                                           std::span<const uint8_t> chunk) noexcept;

    common::Result<void> on_succeeded(const ResponseInfo& info) noexcept;

    /**
     * @param info response metadata if a response was received, nullptr otherwise
     */
    common::Result<void> on_failed(const ResponseInfo* info, const RequestError& error) noexcept;

    CallbackPhase phase() const noexcept { return phase_.load(std::memory_order_acquire); }
    bool is_finished() const noexcept { return is_terminal(phase()); }
    TransferHandle handle() const noexcept { return handle_; }
    bool is_queued() const noexcept { return dispatcher_ != nullptr; }

    BridgeStats stats() const noexcept;

private:
    common::Result<void> advance(CallbackPhase next) noexcept;

    template <typename Build, typename Call>
    common::Result<void> deliver(CallbackPhase next, Build&& build, Call&& call) noexcept;

    template <typename Fn>
    common::Result<void> forward(CallbackPhase phase, Fn&& call) noexcept;

    void drain_dispatcher(CallbackPhase next) noexcept;

    void finish() noexcept;

    RequestRegistry* registry_       = nullptr;
    CallbackDispatcher* dispatcher_  = nullptr;
    TransferHandle handle_;
    std::atomic<CallbackPhase> phase_{CallbackPhase::CREATED};
    std::mutex deliver_mutex_;

    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> violations_{0};
    std::atomic<uint64_t> handler_failures_{0};
    std::atomic<uint64_t> lookup_failures_{0};
};

}  // namespace xfer::bridge
