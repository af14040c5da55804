#pragma once

/**
 * @file bridge_context.hpp
 * @brief The two handle registries shared by the host side and the engine side
 */

#include <xfer/bridge/callback_dispatcher.hpp>
#include <xfer/bridge/handle_registry.hpp>
#include <xfer/bridge/progress.hpp>
#include <xfer/bridge/request_callback.hpp>
#include <xfer/common/error.hpp>

#include <memory>

namespace xfer::bridge {

class BridgeContext {
public:
    BridgeContext() : BridgeContext(HandleRegistryConfig{}) {}
    explicit BridgeContext(HandleRegistryConfig registry_config);

    BridgeContext(const BridgeContext&)            = delete;
    BridgeContext& operator=(const BridgeContext&) = delete;

    RequestRegistry& requests() noexcept { return requests_; }
    ProgressRegistry& progress() noexcept { return progress_; }

    /**
     * @brief Register an engine-side handler and bind a new callback bridge to its handle
     *
     * With a dispatcher the bridge posts phase messages instead of calling the
     * handler directly; the dispatcher must use requests() as its registry.
     */
    common::Result<std::shared_ptr<RequestCallbackBridge>> open_request(
        std::shared_ptr<IRequestHandler> handler, CallbackDispatcher* dispatcher = nullptr);

    common::Result<TransferHandle> register_progress_listener(
        std::shared_ptr<IProgressListener> listener);

    bool retire_progress_listener(TransferHandle handle) noexcept {
        return progress_.retire(handle);
    }

private:
    RequestRegistry requests_;
    ProgressRegistry progress_;
};

}  // namespace xfer::bridge
