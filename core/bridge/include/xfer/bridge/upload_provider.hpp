#pragma once

/**
 * @file upload_provider.hpp
 * @brief Chunked, rewindable request-body supplier for the host networking stack
 */

#include <xfer/bridge/progress.hpp>
#include <xfer/common/error.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace xfer::bridge {

/**
 * @brief Acknowledgment channel of the host networking stack
 *
 * Any method may throw to signal that the stack rejected the acknowledgment.
 */
class IUploadDataSink {
public:
    virtual ~IUploadDataSink() = default;

    virtual void on_read_succeeded(size_t bytes_read, bool final_chunk) = 0;
    virtual void on_read_error(const common::Error& error) = 0;
    virtual void on_rewind_succeeded() = 0;
    virtual void on_rewind_error(const common::Error& error) = 0;
};

/**
 * @brief Upload cursor over an immutable body
 *
 * Invariant: 0 <= position() <= length(). Reads advance by
 * min(remaining, buffer size) and, when a progress handle was supplied and
 * bytes were copied, report (position, length) to it. Rewind resets to 0
 * without a progress event.
 * Neither read nor rewind throws: failures go to the sink's error methods.
 */
class UploadCursorProvider {
public:
    explicit UploadCursorProvider(std::vector<uint8_t> body);

    UploadCursorProvider(std::vector<uint8_t> body, ProgressRegistry& progress_registry,
                         TransferHandle progress_handle);

    UploadCursorProvider(const UploadCursorProvider&)            = delete;
    UploadCursorProvider& operator=(const UploadCursorProvider&) = delete;

    uint64_t length() const noexcept { return body_.size(); }

    uint64_t position() const noexcept;

    bool has_progress_handle() const noexcept { return progress_.has_value(); }

    /**
     * @brief Copy the next chunk into @p buffer and acknowledge it to @p sink
     * @return bytes copied (0 once the body is exhausted)
     */
    size_t read(IUploadDataSink& sink, std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Reset the cursor to the start of the body and acknowledge it
     */
    void rewind(IUploadDataSink& sink) noexcept;

private:
    void report_read_error(IUploadDataSink& sink, const common::Error& error) noexcept;
    void report_rewind_error(IUploadDataSink& sink, const common::Error& error) noexcept;

    const std::vector<uint8_t> body_;
    std::optional<ProgressReporter> progress_;

    mutable std::mutex mutex_;
    uint64_t position_ = 0;
};

}  // namespace xfer::bridge
