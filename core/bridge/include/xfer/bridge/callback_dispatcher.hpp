#pragma once

/**
 * @file callback_dispatcher.hpp
 * @brief Single-consumer dispatcher for request phase messages
 *
 * Bridges in queued mode post tagged PhaseMessages onto a bounded channel. One
 * dispatcher thread drains it, re-checks phase ordering per handle, resolves the
 * handle and calls the engine-side handler, then retires the handle on a terminal
 * phase. Callers on host threads only pay for an enqueue.
 */

#include <xfer/bridge/callback_phase.hpp>
#include <xfer/bridge/handle.hpp>
#include <xfer/bridge/request_callback.hpp>
#include <xfer/bridge/request_types.hpp>
#include <xfer/common/error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xfer::bridge {

struct DispatcherConfig {
    size_t queue_capacity = 1024;
    std::chrono::milliseconds enqueue_timeout{100};
    /// Finished handles remembered so that late duplicates are still rejected.
    /// Unfinished handles that left the registry are forgotten once more than
    /// registry capacity plus this many handles are tracked.
    size_t terminal_history = 4096;
};

struct PhaseMessage {
    TransferHandle handle = INVALID_HANDLE;
    CallbackPhase phase   = CallbackPhase::CREATED;
    std::optional<ResponseInfo> info;
    std::string new_location;
    std::vector<uint8_t> chunk;
    RequestError error;
};

struct DispatcherStats {
    uint64_t posted              = 0;
    uint64_t delivered           = 0;
    uint64_t rejected_full       = 0;
    uint64_t protocol_violations = 0;
    uint64_t lookup_failures     = 0;
    uint64_t handler_failures    = 0;
    size_t queue_size            = 0;
    /// Handles whose last delivered phase is remembered
    size_t tracked_handles       = 0;
};

class CallbackDispatcher {
public:
    explicit CallbackDispatcher(RequestRegistry& registry, DispatcherConfig config = {});
    ~CallbackDispatcher();

    CallbackDispatcher(const CallbackDispatcher&)            = delete;
    CallbackDispatcher& operator=(const CallbackDispatcher&) = delete;

    bool start();

    /**
     * @brief Deliver everything already queued, then stop the dispatcher thread
     */
    void stop();

    bool is_running() const noexcept;

    /**
     * @brief Enqueue a message
     *
     * Waits up to enqueue_timeout for room; QUEUE_FULL afterwards, INVALID_STATE
     * when the dispatcher is not running.
     */
    common::Result<void> post(PhaseMessage message) noexcept;

    /**
     * @brief Block until the queue is empty and no message is being delivered
     */
    bool wait_idle(std::chrono::milliseconds timeout) const;

    DispatcherStats stats() const noexcept;

    RequestRegistry& registry() noexcept;

    const DispatcherConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace xfer::bridge
