#pragma once

/**
 * @file engine.hpp
 * @brief Contract of the external transfer engine
 *
 * The engine owns transport: connection handling, TLS and HTTP parsing all live
 * behind submit(). submit() blocks until the transfer finished and returns 0 on
 * success or an engine-specific non-zero code. Progress is reported from
 * engine-owned threads through the supplied callback.
 */

#include <xfer/bridge/handle.hpp>
#include <xfer/bridge/progress.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace xfer::task {

constexpr int32_t ENGINE_SUCCESS = 0;

struct TransferRequest {
    std::string url;
    std::string destination_path;
    /// JSON object of header name -> value
    std::string headers_json = "{}";
    std::optional<bridge::TransferHandle> progress_handle;
};

class ITransferEngine {
public:
    virtual ~ITransferEngine() = default;

    /**
     * @param progress may be nullptr
     * @return ENGINE_SUCCESS or an engine error code
     */
    virtual int32_t submit(const TransferRequest& request, bridge::IProgressCallback* progress) = 0;

    /**
     * @brief Hint that the transfer bound to @p handle should stop early
     *
     * Engines may ignore it; submit() still returns normally.
     */
    virtual void cancel(bridge::TransferHandle handle) noexcept = 0;
};

}  // namespace xfer::task
