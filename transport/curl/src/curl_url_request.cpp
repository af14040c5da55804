/**
 * @file curl_url_request.cpp
 * @brief libcurl host stack implementation
 */

#include <xfer/common/debug.hpp>
#include <xfer/transport/curl/curl_url_request.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <optional>
#include <span>

namespace xfer::transport::curl {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::TRANSPORT;

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void trim(std::string& text) {
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n' || text.back() == ' ' ||
                             text.back() == '\t')) {
        text.pop_back();
    }
    size_t start = text.find_first_not_of(" \t");
    text.erase(0, start == std::string::npos ? text.size() : start);
}

/**
 * Location may be relative to the URL that answered with it
 */
std::string resolve_location(const std::string& base, const std::string& location) {
    std::string resolved = location;
    CURLU* url           = curl_url();
    if (url == nullptr) {
        return resolved;
    }
    if (curl_url_set(url, CURLUPART_URL, base.c_str(), 0) == CURLUE_OK &&
        curl_url_set(url, CURLUPART_URL, location.c_str(), 0) == CURLUE_OK) {
        char* full = nullptr;
        if (curl_url_get(url, CURLUPART_URL, &full, 0) == CURLUE_OK && full != nullptr) {
            resolved = full;
            curl_free(full);
        }
    }
    curl_url_cleanup(url);
    return resolved;
}

/**
 * Records the provider's acknowledgment of one read or rewind
 */
class UploadSink : public bridge::IUploadDataSink {
public:
    void on_read_succeeded(size_t, bool final_chunk) override {
        if (final_chunk) {
            XFER_LOG_TRACE(LOG_CAT, "upload body complete");
        }
    }

    void on_read_error(const common::Error& error) override { error_ = error; }

    void on_rewind_succeeded() override {}

    void on_rewind_error(const common::Error& error) override { error_ = error; }

    const std::optional<common::Error>& error() const noexcept { return error_; }

private:
    std::optional<common::Error> error_;
};

}  // namespace

common::ErrorCode map_curl_code(int curl_code) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:
            return common::ErrorCode::SUCCESS;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return common::ErrorCode::HOST_UNREACHABLE;
        case CURLE_OPERATION_TIMEDOUT:
            return common::ErrorCode::CONNECTION_TIMEOUT;
        case CURLE_ABORTED_BY_CALLBACK:
            return common::ErrorCode::OPERATION_CANCELLED;
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return common::ErrorCode::IO_FILE_NOT_FOUND;
        case CURLE_READ_ERROR:
        case CURLE_RECV_ERROR:
            return common::ErrorCode::READ_ERROR;
        case CURLE_WRITE_ERROR:
        case CURLE_SEND_ERROR:
            return common::ErrorCode::WRITE_ERROR;
        case CURLE_UNSUPPORTED_PROTOCOL:
            return common::ErrorCode::UNSUPPORTED_FEATURE;
        case CURLE_URL_MALFORMAT:
            return common::ErrorCode::INVALID_ARGUMENT;
        case CURLE_OUT_OF_MEMORY:
            return common::ErrorCode::OUT_OF_MEMORY;
        default:
            return common::ErrorCode::CONNECTION_FAILED;
    }
}

// ============================================================================
// CurlUrlRequest::Impl
// ============================================================================

class CurlUrlRequest::Impl {
public:
    Impl(bridge::RequestCallbackBridge& bridge, CurlRequestOptions options,
         bridge::UploadCursorProvider* upload)
        : bridge_(bridge), options_(std::move(options)), upload_(upload) {
        ensure_global_init();
        info_.url = options_.url;
        info_.url_chain.push_back(options_.url);
    }

    common::Result<void> perform() {
        if (performed_.exchange(true)) {
            return common::err(common::ErrorCode::INVALID_STATE, "request already performed");
        }
        if (cancelled_.load(std::memory_order_acquire)) {
            return deliver_failure(CURLE_ABORTED_BY_CALLBACK, "request cancelled");
        }

        common::debug::TraceScope trace(common::debug::TraceContext::for_handle(bridge_.handle()));
        XFER_SPAN_CAT("CurlUrlRequest::perform", LOG_CAT);
        XFER_LOG_DEBUG(LOG_CAT, options_.method << " " << options_.url << " for handle "
                                                << bridge::handle_to_string(bridge_.handle()));

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> easy(curl_easy_init(),
                                                                 &curl_easy_cleanup);
        if (!easy) {
            return deliver_failure(CURLE_FAILED_INIT, "curl_easy_init failed");
        }

        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr,
                                                                           &curl_slist_free_all);
        for (const auto& [name, value] : options_.headers) {
            std::string line = name + ": " + value;
            curl_slist* next = curl_slist_append(headers.get(), line.c_str());
            if (next == nullptr) {
                return deliver_failure(CURLE_OUT_OF_MEMORY, "cannot build header list");
            }
            headers.release();
            headers.reset(next);
        }

        char error_buffer[CURL_ERROR_SIZE] = {};
        configure(easy.get(), headers.get(), error_buffer);

        curl_ = easy.get();
        CURLcode result = curl_easy_perform(easy.get());
        curl_ = nullptr;

        if (result == CURLE_OK && !abort_error_) {
            return deliver_success(easy.get());
        }
        return deliver_failure(result, error_buffer[0] != '\0' ? error_buffer
                                                                : curl_easy_strerror(result));
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    CurlRequestStats stats() const noexcept {
        CurlRequestStats s;
        s.bytes_received = bytes_received_.load(std::memory_order_relaxed);
        s.bytes_sent     = bytes_sent_.load(std::memory_order_relaxed);
        s.redirects      = redirects_.load(std::memory_order_relaxed);
        s.rewinds        = rewinds_.load(std::memory_order_relaxed);
        return s;
    }

private:
    void configure(CURL* easy, curl_slist* headers, char* error_buffer) {
        curl_easy_setopt(easy, CURLOPT_URL, options_.url.c_str());
        curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy, CURLOPT_BUFFERSIZE, options_.buffer_size);

        if (upload_ != nullptr) {
            const auto length = static_cast<curl_off_t>(upload_->length());
            if (options_.method == "POST") {
                curl_easy_setopt(easy, CURLOPT_POST, 1L);
                curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE, length);
            } else {
                curl_easy_setopt(easy, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(easy, CURLOPT_INFILESIZE_LARGE, length);
                if (options_.method != "PUT") {
                    curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, options_.method.c_str());
                }
            }
            curl_easy_setopt(easy, CURLOPT_UPLOAD_BUFFERSIZE, options_.buffer_size);
            curl_easy_setopt(easy, CURLOPT_READFUNCTION, &Impl::read_callback);
            curl_easy_setopt(easy, CURLOPT_READDATA, this);
            curl_easy_setopt(easy, CURLOPT_SEEKFUNCTION, &Impl::seek_callback);
            curl_easy_setopt(easy, CURLOPT_SEEKDATA, this);
        } else if (options_.method == "HEAD") {
            curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
        } else if (options_.method != "GET") {
            curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, options_.method.c_str());
        }

        if (headers != nullptr) {
            curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers);
        }

        curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));

        curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
        curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
        if (!options_.ca_cert_path.empty()) {
            curl_easy_setopt(easy, CURLOPT_CAINFO, options_.ca_cert_path.c_str());
        }

        if (options_.follow_redirects) {
            curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(easy, CURLOPT_MAXREDIRS, options_.max_redirects);
        }

        curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &Impl::header_callback);
        curl_easy_setopt(easy, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &Impl::write_callback);
        curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);

        curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(easy, CURLOPT_XFERINFOFUNCTION, &Impl::progress_callback);
        curl_easy_setopt(easy, CURLOPT_XFERINFODATA, this);
    }

    // ------------------------------------------------------------------------
    // libcurl callbacks
    // ------------------------------------------------------------------------

    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self         = static_cast<Impl*>(userdata);
        const size_t total = size * nitems;
        try {
            return self->on_header_line(std::string(buffer, total)) ? total : 0;
        } catch (const std::exception& e) {
            self->abort(common::ErrorCode::UNKNOWN_ERROR, e.what());
            return 0;
        } catch (...) {
            self->abort(common::ErrorCode::UNKNOWN_ERROR, "non-standard exception");
            return 0;
        }
    }

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self         = static_cast<Impl*>(userdata);
        const size_t total = size * nmemb;
        try {
            return self->on_body(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(ptr),
                                                          total))
                       ? total
                       : 0;
        } catch (const std::exception& e) {
            self->abort(common::ErrorCode::UNKNOWN_ERROR, e.what());
            return 0;
        } catch (...) {
            self->abort(common::ErrorCode::UNKNOWN_ERROR, "non-standard exception");
            return 0;
        }
    }

    static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<Impl*>(userdata);
        UploadSink sink;
        size_t n = self->upload_->read(
            sink, std::span<uint8_t>(reinterpret_cast<uint8_t*>(buffer), size * nitems));
        if (sink.error()) {
            XFER_LOG_WARN(LOG_CAT, "upload read rejected: " << sink.error()->message());
            self->upload_error_ = *sink.error();
            return CURL_READFUNC_ABORT;
        }
        self->bytes_sent_.fetch_add(n, std::memory_order_relaxed);
        return n;
    }

    static int seek_callback(void* userdata, curl_off_t offset, int origin) {
        auto* self = static_cast<Impl*>(userdata);
        if (origin != SEEK_SET || offset != 0) {
            return CURL_SEEKFUNC_CANTSEEK;
        }
        UploadSink sink;
        self->upload_->rewind(sink);
        if (sink.error()) {
            XFER_LOG_WARN(LOG_CAT, "upload rewind rejected: " << sink.error()->message());
            self->upload_error_ = *sink.error();
            return CURL_SEEKFUNC_FAIL;
        }
        self->rewinds_.fetch_add(1, std::memory_order_relaxed);
        return CURL_SEEKFUNC_OK;
    }

    static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t,
                                 curl_off_t) {
        auto* self = static_cast<Impl*>(userdata);
        return self->cancelled_.load(std::memory_order_acquire) ? 1 : 0;
    }

    // ------------------------------------------------------------------------
    // Phase translation
    // ------------------------------------------------------------------------

    bool on_header_line(std::string line) {
        trim(line);

        if (line.rfind("HTTP/", 0) == 0) {
            block_headers_.clear();
            block_status_ = 0;
            block_text_.clear();
            in_block_ = true;

            size_t space = line.find(' ');
            block_protocol_ = to_lower(line.substr(0, space));
            if (block_protocol_ == "http/2" || block_protocol_ == "http/2.0") {
                block_protocol_ = "h2";
            } else if (block_protocol_ == "http/3") {
                block_protocol_ = "h3";
            }
            if (space != std::string::npos) {
                std::string rest = line.substr(space + 1);
                block_status_    = std::atoi(rest.c_str());
                size_t text      = rest.find(' ');
                if (text != std::string::npos) {
                    block_text_ = rest.substr(text + 1);
                }
            }
            return true;
        }

        if (line.empty()) {
            if (!in_block_) {
                return true;
            }
            in_block_ = false;
            return on_header_block_end();
        }

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name  = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            trim(name);
            trim(value);
            block_headers_.emplace_back(std::move(name), std::move(value));
        }
        return true;
    }

    bool on_header_block_end() {
        if (block_status_ >= 100 && block_status_ < 200) {
            return true;
        }

        update_url();
        info_.http_status_code    = block_status_;
        info_.http_status_text    = block_text_;
        info_.headers             = block_headers_;
        info_.negotiated_protocol = block_protocol_;

        auto location = info_.header("Location");
        if (options_.follow_redirects && block_status_ >= 300 && block_status_ < 400 &&
            location) {
            std::string next = resolve_location(info_.url, *location);
            XFER_LOG_DEBUG(LOG_CAT, block_status_ << " redirect to " << next);

            auto result = bridge_.on_redirect_received(info_, next);
            if (result.is_error()) {
                abort(result.error());
                return false;
            }
            info_.url_chain.push_back(next);
            redirects_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }

        return start_response();
    }

    bool on_body(std::span<const uint8_t> chunk) {
        if (!response_started_) {
            update_url();
            if (!start_response()) {
                return false;
            }
        }

        info_.received_byte_count += chunk.size();
        bytes_received_.fetch_add(chunk.size(), std::memory_order_relaxed);

        auto result = bridge_.on_read_completed(info_, chunk);
        if (result.is_error()) {
            abort(result.error());
            return false;
        }
        return true;
    }

    bool start_response() {
        if (response_started_) {
            return true;
        }
        response_started_ = true;

        if (info_.negotiated_protocol.empty() && curl_ != nullptr) {
            const char* scheme = nullptr;
            if (curl_easy_getinfo(curl_, CURLINFO_SCHEME, &scheme) == CURLE_OK &&
                scheme != nullptr) {
                info_.negotiated_protocol = to_lower(scheme);
            }
        }

        auto result = bridge_.on_response_started(info_);
        if (result.is_error()) {
            abort(result.error());
            return false;
        }
        return true;
    }

    void update_url() {
        if (curl_ == nullptr) {
            return;
        }
        const char* effective = nullptr;
        if (curl_easy_getinfo(curl_, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK &&
            effective != nullptr) {
            info_.url = effective;
        }
        long code = 0;
        if (block_status_ == 0 &&
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK) {
            info_.http_status_code = static_cast<int>(code);
        }
    }

    void abort(common::Error error) {
        XFER_LOG_WARN(LOG_CAT, "aborting transfer for "
                                   << bridge::handle_to_string(bridge_.handle()) << ": "
                                   << error.message());
        if (!abort_error_) {
            abort_error_ = std::move(error);
        }
    }

    void abort(common::ErrorCode code, std::string message) {
        abort(common::Error(code, std::move(message)));
    }

    // ------------------------------------------------------------------------
    // Terminal phases
    // ------------------------------------------------------------------------

    common::Result<void> deliver_success(CURL* easy) {
        curl_ = easy;
        if (!response_started_) {
            update_url();
            start_response();
        }
        curl_ = nullptr;

        if (abort_error_) {
            return deliver_failure(CURLE_ABORTED_BY_CALLBACK, abort_error_->message());
        }

        auto result = bridge_.on_succeeded(info_);
        if (result.is_error()) {
            XFER_LOG_WARN(LOG_CAT, "succeeded phase rejected: " << result.message());
            return result;
        }
        XFER_LOG_DEBUG(LOG_CAT, "transfer finished, " << info_.received_byte_count
                                                       << " bytes received");
        return common::ok();
    }

    common::Result<void> deliver_failure(CURLcode code, const std::string& message) {
        bridge::RequestError error;
        error.internal_code = static_cast<int>(code);
        if (abort_error_) {
            error.code    = abort_error_->code();
            error.message = abort_error_->message();
        } else if (upload_error_) {
            error.code    = upload_error_->code();
            error.message = upload_error_->message();
        } else if (cancelled_.load(std::memory_order_acquire)) {
            error.code    = common::ErrorCode::OPERATION_CANCELLED;
            error.message = "request cancelled";
        } else {
            error.code    = map_curl_code(code);
            error.message = message;
        }

        XFER_LOG_INFO(LOG_CAT, "transfer failed: " << error.to_string());

        auto result = bridge_.on_failed(response_started_ ? &info_ : nullptr, error);
        if (result.is_error()) {
            XFER_LOG_DEBUG(LOG_CAT, "failed phase not forwarded: " << result.message());
        }
        return common::Error(error.code, error.message);
    }

    bridge::RequestCallbackBridge& bridge_;
    CurlRequestOptions options_;
    bridge::UploadCursorProvider* upload_;

    CURL* curl_ = nullptr;
    std::atomic<bool> performed_{false};
    std::atomic<bool> cancelled_{false};

    bridge::ResponseInfo info_;
    bool response_started_ = false;

    bool in_block_    = false;
    int block_status_ = 0;
    std::string block_text_;
    std::string block_protocol_;
    bridge::HeaderList block_headers_;

    std::optional<common::Error> abort_error_;
    std::optional<common::Error> upload_error_;

    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint32_t> redirects_{0};
    std::atomic<uint32_t> rewinds_{0};
};

// ============================================================================
// CurlUrlRequest
// ============================================================================

CurlUrlRequest::CurlUrlRequest(bridge::RequestCallbackBridge& bridge, CurlRequestOptions options,
                               bridge::UploadCursorProvider* upload)
    : impl_(std::make_unique<Impl>(bridge, std::move(options), upload)) {}

CurlUrlRequest::~CurlUrlRequest() = default;

common::Result<void> CurlUrlRequest::perform() {
    return impl_->perform();
}

void CurlUrlRequest::cancel() noexcept {
    impl_->cancel();
}

CurlRequestStats CurlUrlRequest::stats() const noexcept {
    return impl_->stats();
}

std::string CurlUrlRequest::version() {
    return curl_version();
}

}  // namespace xfer::transport::curl
