#pragma once

/**
 * @file curl_url_request.hpp
 * @brief libcurl host stack driving a RequestCallbackBridge
 *
 * One CurlUrlRequest runs one libcurl easy transfer and turns its callbacks into
 * request phases:
 * - end of a 3xx header block with Location, while following redirects: redirect
 * - first final header block, or first body byte for header-less protocols:
 *   response started
 * - each body write: read completed
 * - CURLE_OK: succeeded, any other result: failed
 *
 * With an UploadCursorProvider the request body is pulled through the provider's
 * read() and rewind(); a rejected acknowledgment aborts this upload only. Any
 * error returned by the bridge (for example a protocol violation) aborts the
 * transfer.
 */

#include <xfer/bridge/request_callback.hpp>
#include <xfer/bridge/request_types.hpp>
#include <xfer/bridge/upload_provider.hpp>
#include <xfer/common/error.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace xfer::transport::curl {

struct CurlRequestOptions {
    std::string url;
    /// "GET", "POST", "PUT", ...; a body is sent only when an upload provider is given
    std::string method = "GET";
    bridge::HeaderList headers;

    bool follow_redirects = true;
    long max_redirects    = 10;

    std::chrono::milliseconds connect_timeout{10000};
    /// 0 disables the overall timeout
    std::chrono::milliseconds timeout{0};

    bool verify_tls = true;
    std::string ca_cert_path;

    /// Body chunk size requested from libcurl (CURLOPT_BUFFERSIZE / UPLOAD_BUFFERSIZE)
    long buffer_size = 16 * 1024;
};

struct CurlRequestStats {
    uint64_t bytes_received = 0;
    uint64_t bytes_sent     = 0;
    uint32_t redirects      = 0;
    uint32_t rewinds        = 0;
};

/**
 * @brief Map a CURLcode to the error code delivered with the FAILED phase
 */
common::ErrorCode map_curl_code(int curl_code) noexcept;

class CurlUrlRequest {
public:
    CurlUrlRequest(bridge::RequestCallbackBridge& bridge, CurlRequestOptions options,
                   bridge::UploadCursorProvider* upload = nullptr);
    ~CurlUrlRequest();

    CurlUrlRequest(const CurlUrlRequest&)            = delete;
    CurlUrlRequest& operator=(const CurlUrlRequest&) = delete;

    /**
     * @brief Run the transfer on the calling thread until it finished
     *
     * Exactly one of SUCCEEDED or FAILED is delivered to the bridge. The returned
     * error mirrors the one delivered with FAILED. INVALID_STATE on a second call.
     */
    common::Result<void> perform();

    /**
     * @brief Abort a running perform() from another thread
     */
    void cancel() noexcept;

    CurlRequestStats stats() const noexcept;

    /**
     * @brief libcurl version string
     */
    static std::string version();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace xfer::transport::curl
