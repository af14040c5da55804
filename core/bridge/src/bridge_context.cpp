#include <xfer/bridge/bridge_context.hpp>
#include <xfer/common/debug.hpp>

namespace xfer::bridge {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::BRIDGE;
}  // namespace

BridgeContext::BridgeContext(HandleRegistryConfig registry_config)
    : requests_(registry_config), progress_(registry_config) {}

common::Result<std::shared_ptr<RequestCallbackBridge>> BridgeContext::open_request(
    std::shared_ptr<IRequestHandler> handler, CallbackDispatcher* dispatcher) {
    if (dispatcher && &dispatcher->registry() != &requests_) {
        return common::err<std::shared_ptr<RequestCallbackBridge>>(
            common::ErrorCode::INVALID_ARGUMENT, "dispatcher serves a different registry");
    }

    auto handle = requests_.register_item(std::move(handler));
    if (handle.is_error()) {
        XFER_LOG_WARN(LOG_CAT, "cannot open request: " << handle.message());
        return handle.error();
    }

    if (dispatcher) {
        return std::make_shared<RequestCallbackBridge>(*dispatcher, handle.value());
    }
    return std::make_shared<RequestCallbackBridge>(requests_, handle.value());
}

common::Result<TransferHandle> BridgeContext::register_progress_listener(
    std::shared_ptr<IProgressListener> listener) {
    return progress_.register_item(std::move(listener));
}

}  // namespace xfer::bridge
