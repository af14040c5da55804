#pragma once

/**
 * @file request_handler.hpp
 * @brief Engine-side receiver of request phases, addressed by handle
 *
 * The transfer engine registers one handler per in-flight request in a
 * HandleRegistry<IRequestHandler> and hands the issued handle to the host side.
 * Implementations are called from host-stack threads and must return quickly.
 */

#include <xfer/bridge/request_types.hpp>

#include <chrono>
#include <cstdint>
#include <span>
#include <string>

namespace xfer::bridge {

/// Handler calls running longer than this are logged as warnings
constexpr std::chrono::milliseconds HANDLER_TIME_BUDGET{100};

class IRequestHandler {
public:
    virtual ~IRequestHandler() = default;

    virtual void on_redirect_received(const ResponseInfo& info,
                                      const std::string& new_location) = 0;

    virtual void on_response_started(const ResponseInfo& info) = 0;

    virtual void on_read_completed(const ResponseInfo& info,
                                   std::span<const uint8_t> chunk) = 0;

    virtual void on_succeeded(const ResponseInfo& info) = 0;

    virtual void on_failed(const ResponseInfo* info, const RequestError& error) = 0;
};

}  // namespace xfer::bridge
