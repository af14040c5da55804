#pragma once

/**
 * @file request_types.hpp
 * @brief Response metadata and failure description delivered with request phases
 */

#include <xfer/common/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xfer::bridge {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Host stack's view of a response (one per hop for redirects)
 */
struct ResponseInfo {
    std::string url;
    std::vector<std::string> url_chain;
    int http_status_code = 0;
    std::string http_status_text;
    HeaderList headers;
    std::string negotiated_protocol;
    bool was_cached              = false;
    uint64_t received_byte_count = 0;

    /**
     * @brief First header with a case-insensitive name match
     */
    std::optional<std::string> header(std::string_view name) const;
};

/**
 * @brief Failure reported with the FAILED phase
 */
struct RequestError {
    common::ErrorCode code = common::ErrorCode::CONNECTION_FAILED;
    int internal_code      = 0;
    std::string message;

    std::string to_string() const;
};

}  // namespace xfer::bridge
